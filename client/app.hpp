#pragma once
/**
 * @file app.hpp
 * @brief Event loop hosting a clipboard transfer
 *
 */

#include "escape_scanner.hpp"

#include <osc52/loop.hpp>

#include <utility> // Boost 1.74's awaitable uses std::exchange without including it
#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <vector>

namespace osc52 {
class Transfer;
}

class App final : public osc52::Loop
{
public:
    /// Input reads are paused while this many bytes wait for the terminal
    static constexpr std::size_t backlog_limit = 65'536;

    /// How long a lone ESC waits for the rest of an escape sequence
    static constexpr std::chrono::milliseconds escape_delay {25};

private:
    boost::asio::io_context io_context_;
    boost::asio::posix::stream_descriptor tty_;
    boost::asio::posix::stream_descriptor stdin_;
    boost::asio::signal_set signals_;
    boost::asio::steady_timer escape_timer_;
    EscapeScanner scanner_;
    std::vector<TerminalEvent> events_;

    /// @brief The bytes held for async_write
    std::vector<char> sending_;

    /// @brief The bytes accumulated for the next write
    std::vector<char> send_;

    osc52::Transfer* transfer_;
    boost::system::error_code tty_error_;

    bool stdin_pollable_;
    bool wakeup_deferred_;
    bool quitting_;
    bool stopped_;

public:
    /**
     * @brief Construct the loop around open descriptors
     *
     * Neither descriptor is closed by the App.
     *
     * @param tty_fd Terminal in raw mode
     * @param stdin_fd Payload source
     */
    App(int tty_fd, int stdin_fd);
    ~App();

    App(App const&) = delete;
    App(App&&) = delete;
    auto operator=(App const&) -> App& = delete;
    auto operator=(App&&) -> App& = delete;

    /// @brief Run the transfer until it finishes and its output is flushed
    auto run(osc52::Transfer& transfer) -> void;

    /// @brief False once standard input turned out to be served by post instead of readiness
    auto stdin_pollable() const -> bool
    {
        return stdin_pollable_;
    }

    /// @brief First failure reading or writing the terminal
    auto tty_error() const -> boost::system::error_code
    {
        return tty_error_;
    }

    auto write(std::string_view bytes) -> void override;
    auto wakeup() -> void override;
    auto quit() -> void override;

private:
    auto tty_thread() -> boost::asio::awaitable<void>;
    auto signal_thread() -> boost::asio::awaitable<void>;
    auto write_actual() -> void;
    auto dispatch() -> void;
    auto shutdown() -> void;
};
