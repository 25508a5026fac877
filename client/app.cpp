#include "app.hpp"

#include <osc52/transfer.hpp>

#include <array>
#include <csignal>
#include <exception>
#include <utility>
#include <variant>

namespace {

/// co_spawn completion that lets exceptions escape io_context::run
constexpr auto rethrow = [](std::exception_ptr const e) -> void {
    if (e)
    {
        std::rethrow_exception(e);
    }
};

} // namespace

App::App(int const tty_fd, int const stdin_fd)
    : io_context_{}
    , tty_{io_context_, tty_fd}
    , stdin_{io_context_}
    , signals_{io_context_, SIGINT, SIGTERM, SIGHUP}
    , escape_timer_{io_context_}
    , scanner_{}
    , events_{}
    , sending_{}
    , send_{}
    , transfer_{}
    , tty_error_{}
    , stdin_pollable_{false}
    , wakeup_deferred_{false}
    , quitting_{false}
    , stopped_{false}
{
    signals_.add(SIGQUIT);

    // a descriptor that can't be registered is read without waiting
    boost::system::error_code ec;
    stdin_.assign(stdin_fd, ec);
    stdin_pollable_ = not ec;
}

App::~App()
{
    if (tty_.is_open()) tty_.release();
    if (stdin_.is_open()) stdin_.release();
}

auto App::run(osc52::Transfer& transfer) -> void
{
    transfer_ = &transfer;
    boost::asio::co_spawn(io_context_, tty_thread(), rethrow);
    boost::asio::co_spawn(io_context_, signal_thread(), rethrow);
    boost::asio::post(io_context_, [this]() { transfer_->start(); });
    io_context_.run();
    transfer_ = nullptr;
}

auto App::tty_thread() -> boost::asio::awaitable<void>
{
    std::array<char, 4096> buffer;

    while (not stopped_)
    {
        boost::system::error_code ec;
        auto const n = co_await tty_.async_read_some(
            boost::asio::buffer(buffer),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec)
        {
            if (boost::asio::error::operation_aborted != ec && not tty_error_)
            {
                tty_error_ = ec;
                shutdown();
            }
            co_return;
        }

        escape_timer_.cancel();
        scanner_.feed({buffer.data(), n}, events_);
        dispatch();

        if (scanner_.pending_escape() && not stopped_)
        {
            escape_timer_.expires_after(escape_delay);
            escape_timer_.async_wait([this](boost::system::error_code const error) {
                if (not error)
                {
                    scanner_.flush(events_);
                    dispatch();
                }
            });
        }
    }
}

auto App::signal_thread() -> boost::asio::awaitable<void>
{
    while (not stopped_)
    {
        boost::system::error_code ec;
        auto const signo = co_await signals_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec)
        {
            co_return;
        }

        if (transfer_)
        {
            transfer_->on_signal(signo);
        }
    }
}

auto App::dispatch() -> void
{
    for (auto const& event : events_)
    {
        if (nullptr == transfer_)
        {
            break;
        }

        if (auto const key = std::get_if<osc52::KeyEvent>(&event))
        {
            transfer_->on_key_event(*key);
        }
        else
        {
            auto const& reply = std::get<EscapePayload>(event);
            transfer_->on_escape_payload(reply.kind, reply.payload);
        }
    }
    events_.clear();
}

auto App::write(std::string_view const bytes) -> void
{
    if (not bytes.empty() && not stopped_)
    {
        send_.insert(end(send_), begin(bytes), end(bytes));
        if (sending_.empty())
        {
            write_actual();
        }
    }
}

auto App::write_actual() -> void
{
    std::swap(send_, sending_);
    boost::asio::async_write(
        tty_,
        boost::asio::buffer(sending_),
        [this](boost::system::error_code const& error, std::size_t) {
            sending_.clear();

            if (error)
            {
                if (not tty_error_) tty_error_ = error;
                shutdown();
                return;
            }

            if (not send_.empty())
            {
                write_actual();
            }
            else if (quitting_)
            {
                shutdown();
                return;
            }

            if (wakeup_deferred_ && send_.size() + sending_.size() < backlog_limit)
            {
                wakeup_deferred_ = false;
                wakeup();
            }
        }
    );
}

auto App::wakeup() -> void
{
    if (quitting_ || stopped_)
    {
        return;
    }

    // bounded memory: let the terminal catch up before reading more
    if (send_.size() + sending_.size() >= backlog_limit)
    {
        wakeup_deferred_ = true;
        return;
    }

    if (stdin_pollable_)
    {
        stdin_.async_wait(
            boost::asio::posix::stream_descriptor::wait_read,
            [this](boost::system::error_code const error) {
                if (boost::asio::error::operation_aborted == error || nullptr == transfer_)
                {
                    return;
                }

                // epoll refuses regular files and /dev/null; reads on those never block
                if (boost::asio::error::operation_not_supported == error)
                {
                    stdin_pollable_ = false;
                }

                // other errors resurface from the read itself
                transfer_->on_input();
            });
    }
    else
    {
        boost::asio::post(io_context_, [this]() {
            if (transfer_)
            {
                transfer_->on_input();
            }
        });
    }
}

auto App::quit() -> void
{
    quitting_ = true;
    if (send_.empty() && sending_.empty())
    {
        shutdown();
    }
}

auto App::shutdown() -> void
{
    if (stopped_)
    {
        return;
    }
    stopped_ = true;

    tty_.cancel();
    if (stdin_.is_open()) stdin_.cancel();
    signals_.cancel();
    escape_timer_.cancel();
}
