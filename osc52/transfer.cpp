#include "osc52/transfer.hpp"

#include "osc52/errors.hpp"
#include "osc52/reply.hpp"

#include <cstring>
#include <ostream>
#include <string>
#include <variant>

namespace osc52 {

namespace {

auto cancel_warning(Key const key) -> std::string
{
    std::string msg {"Waiting for response from terminal, press "};
    msg += Key::CtrlC == key ? "Ctrl+C" : "Esc";
    msg += " again to abort. This could cause garbage to be spewed to the screen.\r\n";
    return msg;
}

} // namespace

auto operator<<(std::ostream& out, Phase const phase) -> std::ostream&
{
    switch (phase)
    {
        case Phase::Sending: out << "Sending"; return out;
        case Phase::AwaitingAck: out << "AwaitingAck"; return out;
        case Phase::AwaitingData: out << "AwaitingData"; return out;
        case Phase::Completed: out << "Completed"; return out;
        case Phase::Aborted: out << "Aborted"; return out;
        case Phase::Failed: out << "Failed"; return out;
    }
    return out;
}

Transfer::Transfer(TransferOptions const options, Source& source, Loop& loop)
    : options_{options}
    , loop_{loop}
    , frames_{loop, options.use_secondary_selection ? Target::Primary : Target::Clipboard}
    , pump_{source}
    , state_{}
    , encoded_{}
{
}

auto Transfer::done() const -> bool
{
    switch (state_.phase)
    {
    case Phase::Completed:
    case Phase::Aborted:
    case Phase::Failed:
        return true;
    default:
        return false;
    }
}

auto Transfer::start() -> void
{
    // An empty piped payload still opens a frame: that clears the selection.
    if (not pump_.interactive())
    {
        frames_.open();
    }
    on_input();
}

auto Transfer::on_input() -> void
{
    if (Phase::Sending != state_.phase)
    {
        return;
    }

    boost::system::error_code ec;
    encoded_.clear();
    auto const status = pump_.pull(encoded_, ec);

    if (ec)
    {
        stop(Phase::Failed, {Errc::ReadFailed, make_error_code(Errc::ReadFailed).message() + ": " + ec.message()});
        return;
    }

    if (not encoded_.empty())
    {
        frames_.payload(encoded_);
    }

    switch (status)
    {
    case PumpStatus::Data:
    case PumpStatus::Pending:
        loop_.wakeup();
        break;
    case PumpStatus::Finished:
        finish_sending();
        break;
    }
}

auto Transfer::finish_sending() -> void
{
    frames_.close();

    if (options_.request_from_terminal)
    {
        state_.phase = Phase::AwaitingData;
        frames_.request_read();
    }
    else if (options_.wait_for_ack)
    {
        state_.phase = Phase::AwaitingAck;
        frames_.request_ack();
    }
    else
    {
        complete(std::nullopt);
    }
}

auto Transfer::on_escape_payload(EscapeKind const kind, std::string_view const payload) -> void
{
    if (Phase::AwaitingAck != state_.phase && Phase::AwaitingData != state_.phase)
    {
        return;
    }

    boost::system::error_code ec;
    auto const reply = decode_reply(kind, payload, ec);

    if (Phase::AwaitingAck == state_.phase)
    {
        if (std::holds_alternative<AckReply>(reply))
        {
            complete(std::nullopt);
        }
    }
    else if (ec)
    {
        stop(Phase::Failed, {ec, ec.message()});
    }
    else if (auto const clipboard = std::get_if<ClipboardReply>(&reply))
    {
        complete(clipboard->payload);
    }
}

auto Transfer::on_key_event(KeyEvent const event) -> void
{
    if (Key::CtrlC != event.key && Key::Escape != event.key)
    {
        return;
    }

    // Cancelling while a frame is in flight would corrupt it, and once
    // finished there is nothing left to cancel.
    if (Phase::AwaitingAck != state_.phase && Phase::AwaitingData != state_.phase)
    {
        return;
    }

    switch (state_.cancel_attempts++)
    {
    case 0:
        loop_.write(cancel_warning(event.key));
        break;
    default:
        stop(Phase::Aborted, {Errc::AbortedByUser, make_error_code(Errc::AbortedByUser).message()});
        break;
    }
}

auto Transfer::on_signal(int const signo) -> void
{
    if (done())
    {
        return;
    }

    state_.signal = signo;

    std::string description {"terminated by signal"};
    if (auto const name = strsignal(signo))
    {
        description += ": ";
        description += name;
    }
    stop(Phase::Failed, {Errc::TerminatedBySignal, std::move(description)});
}

auto Transfer::complete(std::optional<std::string> payload) -> void
{
    if (Phase::AwaitingData == state_.phase)
    {
        state_.received_payload = std::move(payload);
    }
    state_.phase = Phase::Completed;
    loop_.quit();
}

auto Transfer::stop(Phase const phase, Failure failure) -> void
{
    // leave the terminal outside of the OSC string so later output is visible
    frames_.close();

    state_.phase = phase;
    state_.error = std::move(failure);
    loop_.quit();
}

} // namespace osc52
