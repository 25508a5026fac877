#include "stdin_source.hpp"

#include <boost/asio/error.hpp>

#include <cerrno>
#include <unistd.h>

StdinSource::StdinSource(int const fd)
    : fd_{fd}
    , interactive_{1 == isatty(fd)}
{
}

auto StdinSource::read_some(std::span<char> const buffer, boost::system::error_code& ec) -> std::size_t
{
    ec = {};

    ssize_t n;
    do
    {
        n = read(fd_, buffer.data(), buffer.size());
    } while (-1 == n && EINTR == errno);

    if (-1 == n)
    {
        ec.assign(errno, boost::system::system_category());
        return 0;
    }

    if (0 == n)
    {
        ec = boost::asio::error::eof;
    }

    return n;
}
