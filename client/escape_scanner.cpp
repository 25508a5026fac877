#include "escape_scanner.hpp"

namespace {

char const ESC = '\x1b';
char const BEL = '\x07';
char const ETX = '\x03'; // Ctrl+C

auto key(osc52::Key const k) -> TerminalEvent
{
    return osc52::KeyEvent{k};
}

} // namespace

auto EscapeScanner::feed(std::string_view const input, std::vector<TerminalEvent>& events) -> void
{
    for (auto const c : input)
    {
        switch (state_)
        {
        case State::Ground:
            if (ESC == c)
            {
                state_ = State::Escape;
            }
            else
            {
                events.push_back(key(ETX == c ? osc52::Key::CtrlC : osc52::Key::Other));
            }
            break;

        case State::Escape:
            switch (c)
            {
            case ']':
                kind_ = osc52::EscapeKind::Osc;
                body_.clear();
                state_ = State::String;
                break;
            case 'P':
                kind_ = osc52::EscapeKind::Dcs;
                body_.clear();
                state_ = State::String;
                break;
            case '[':
                state_ = State::Csi;
                break;
            case ESC: // the first one was the Esc key
                events.push_back(key(osc52::Key::Escape));
                break;
            default: // meta-modified key
                events.push_back(key(osc52::Key::Other));
                state_ = State::Ground;
                break;
            }
            break;

        case State::Csi:
            if ('\x40' <= c && c <= '\x7e') // final byte
            {
                events.push_back(key(osc52::Key::Other));
                state_ = State::Ground;
            }
            break;

        case State::String:
            if (ESC == c)
            {
                state_ = State::StringEscape;
            }
            else if (BEL == c && osc52::EscapeKind::Osc == kind_)
            {
                events.push_back(EscapePayload{kind_, std::move(body_)});
                body_.clear();
                state_ = State::Ground;
            }
            else
            {
                body_.push_back(c);
            }
            break;

        case State::StringEscape:
            if ('\\' == c)
            {
                events.push_back(EscapePayload{kind_, std::move(body_)});
                body_.clear();
                state_ = State::Ground;
            }
            else if (ESC == c)
            {
                body_.push_back(ESC);
            }
            else
            {
                body_.push_back(ESC);
                body_.push_back(c);
                state_ = State::String;
            }
            break;
        }
    }
}

auto EscapeScanner::flush(std::vector<TerminalEvent>& events) -> void
{
    if (State::Escape == state_)
    {
        events.push_back(key(osc52::Key::Escape));
        state_ = State::Ground;
    }
}
