#include "tty.hpp"

#include <boost/system/system_error.hpp>

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace {

[[noreturn]] auto throw_errno(char const* what) -> void
{
    throw boost::system::system_error{errno, boost::system::system_category(), what};
}

} // namespace

Tty::Tty(char const* const path)
    : fd_{open(path, O_RDWR | O_NOCTTY | O_CLOEXEC)}
    , saved_{}
{
    if (-1 == fd_)
    {
        throw_errno(path);
    }

    if (-1 == tcgetattr(fd_, &saved_))
    {
        auto const err = errno;
        close(fd_);
        errno = err;
        throw_errno("tcgetattr");
    }

    auto raw = saved_;
    cfmakeraw(&raw);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;

    if (-1 == tcsetattr(fd_, TCSAFLUSH, &raw))
    {
        auto const err = errno;
        close(fd_);
        errno = err;
        throw_errno("tcsetattr");
    }
}

Tty::~Tty()
{
    // TCSADRAIN: everything queued for the terminal goes out first
    tcsetattr(fd_, TCSADRAIN, &saved_);
    close(fd_);
}
