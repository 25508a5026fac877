#pragma once
/**
 * @file tty.hpp
 * @brief Controlling terminal in raw mode
 *
 */

#include <termios.h>

/**
 * @brief Opens a terminal device and puts it in raw mode
 *
 * Raw mode passes every key through unprocessed, including Ctrl+C,
 * and stops the terminal from echoing the replies it sends us. The
 * original settings are restored and the device closed on destruction.
 */
class Tty final
{
    int fd_;
    termios saved_;

public:
    /**
     * @brief Open and configure the terminal
     * @param path Terminal device, normally /dev/tty
     * @throw boost::system::system_error on failure
     */
    explicit Tty(char const* path);
    ~Tty();

    Tty(Tty const&) = delete;
    Tty(Tty&&) = delete;
    auto operator=(Tty const&) -> Tty& = delete;
    auto operator=(Tty&&) -> Tty& = delete;

    auto fd() const -> int
    {
        return fd_;
    }
};
