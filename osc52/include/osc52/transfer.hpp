#pragma once
/**
 * @file transfer.hpp
 * @brief State machine driving one clipboard transfer
 *
 * A transfer first streams any piped payload to the terminal as an
 * OSC 52 write, then, depending on the options, finishes right away,
 * asks the terminal to acknowledge the write, or asks the terminal for
 * the selection contents. The replies arrive asynchronously through the
 * loop and may never arrive at all, so the wait can be cancelled:
 * the first Ctrl+C or Esc warns, the second aborts.
 *
 *     Sending --eof--> AwaitingData --clipboard reply--> Completed
 *        |      \                   \--bad base64------> Failed
 *        |       \--eof--> AwaitingAck --ack reply-----> Completed
 *        \--eof------------------------------------------> Completed
 *
 * Both waiting phases go to Aborted on the second cancellation.
 */

#include "frames.hpp"
#include "input_pump.hpp"
#include "loop.hpp"

#include <boost/system/error_code.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace osc52 {

struct TransferOptions
{
    /// Address the primary selection instead of the clipboard
    bool use_secondary_selection;

    /// Read the selection from the terminal instead of only writing it
    bool request_from_terminal;

    /// Wait for the terminal to confirm it processed the write
    bool wait_for_ack;
};

enum class Phase
{
    Sending,
    AwaitingAck,
    AwaitingData,
    Completed,
    Aborted,
    Failed,
};

auto operator<<(std::ostream& out, Phase) -> std::ostream&;

struct Failure
{
    boost::system::error_code code;
    std::string description;
};

struct TransferState
{
    Phase phase = Phase::Sending;

    /// Cancellation requests seen while waiting on the terminal
    int cancel_attempts = 0;

    /// Selection contents, only set by a successful read
    std::optional<std::string> received_payload;

    std::optional<Failure> error;

    /// Signal that terminated the transfer, 0 otherwise
    int signal = 0;
};

class Transfer
{
    TransferOptions const options_;
    Loop& loop_;
    FrameEmitter frames_;
    InputPump pump_;
    TransferState state_;

    /// Encoded output of the current chunk, reused between chunks
    std::string encoded_;

public:
    Transfer(TransferOptions options, Source& source, Loop& loop);

    Transfer(Transfer const&) = delete;
    Transfer(Transfer&&) = delete;
    auto operator=(Transfer const&) -> Transfer& = delete;
    auto operator=(Transfer&&) -> Transfer& = delete;

    /// @brief Open the write frame and pull the first chunk
    auto start() -> void;

    /// @brief Pull the next chunk of payload (the loop's wakeup callback)
    auto on_input() -> void;

    /// @brief Handle a whole escape sequence payload from the terminal
    auto on_escape_payload(EscapeKind kind, std::string_view payload) -> void;

    auto on_key_event(KeyEvent event) -> void;

    /// @brief The hosting process received a terminating signal
    auto on_signal(int signo) -> void;

    auto state() const -> TransferState const&
    {
        return state_;
    }

    /// @brief True once the transfer reached Completed, Aborted, or Failed
    auto done() const -> bool;

private:
    auto finish_sending() -> void;
    auto complete(std::optional<std::string> payload) -> void;
    auto stop(Phase phase, Failure failure) -> void;
};

} // namespace osc52
