#pragma once
/**
 * @file escape_scanner.hpp
 * @brief Splits terminal input into key presses and escape sequence replies
 *
 * Only as much of ECMA-48 as a clipboard transfer needs: OSC and DCS
 * strings are collected whole, CSI sequences are skipped, and
 * everything else is reported as a key press.
 */

#include <osc52/loop.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct EscapePayload
{
    osc52::EscapeKind kind;
    std::string payload;

    friend auto operator==(EscapePayload const&, EscapePayload const&) -> bool = default;
};

using TerminalEvent = std::variant<osc52::KeyEvent, EscapePayload>;

class EscapeScanner
{
    enum class State
    {
        Ground,
        Escape,
        Csi,
        String,
        StringEscape,
    };

    State state_;
    osc52::EscapeKind kind_;
    std::string body_;

public:
    EscapeScanner() : state_{State::Ground}, kind_{osc52::EscapeKind::Osc}, body_{} {}

    /**
     * @brief Scan the next bytes read from the terminal
     *
     * Sequences may be split across calls. Completed events are
     * appended to events in input order.
     *
     * @param input Bytes read from the terminal
     * @param events Output events
     */
    auto feed(std::string_view input, std::vector<TerminalEvent>& events) -> void;

    /// @brief True when input ended right after an ESC
    auto pending_escape() const -> bool
    {
        return State::Escape == state_;
    }

    /**
     * @brief Give up waiting for the rest of a sequence after ESC
     *
     * A lone ESC that isn't followed by more input within the escape
     * delay is the Esc key.
     *
     * @param events Output events
     */
    auto flush(std::vector<TerminalEvent>& events) -> void;
};
