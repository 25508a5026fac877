#pragma once
/**
 * @file frames.hpp
 * @brief OSC 52 escape sequence framing
 *
 * A clipboard write is one OSC 52 message whose payload is streamed
 * in as many pieces as it takes:
 *
 *     ESC ] 52 ; c ; <base64> <base64> ... ESC \
 *
 * The terminal concatenates everything up to the string terminator,
 * so pieces must reach it in exactly the order they were produced.
 */

#include <string>
#include <string_view>

namespace osc52 {

class Loop;

/// @brief Selection an OSC 52 message addresses
enum class Target
{
    Clipboard, ///< "c"
    Primary,   ///< "p"
};

/// @brief String terminator closing OSC and DCS messages
inline constexpr std::string_view string_terminator = "\x1b\\";

/// @brief XTGETTCAP query for the "TN" capability; any answer serves as an acknowledgment
inline constexpr std::string_view ack_request = "\x1bP+q544e\x1b\\";

auto target_code(Target) -> char;

/// @brief Opening of a clipboard write, without payload or terminator
auto write_open(Target) -> std::string;

/// @brief Self-contained request for the terminal to report a selection
auto read_request(Target) -> std::string;

/**
 * @brief Emits the frames of one transfer onto a loop
 *
 * Tracks whether a write message is open so that payload is only ever
 * appended inside one and the terminator is emitted at most once.
 */
class FrameEmitter
{
    Loop& loop_;
    Target target_;
    bool open_;
    bool closed_;

public:
    FrameEmitter(Loop& loop, Target target)
        : loop_{loop}
        , target_{target}
        , open_{false}
        , closed_{false}
    {
    }

    /// @brief Start the write message. Only the first call has an effect.
    auto open() -> void;

    /**
     * @brief Append encoded payload to the open write message
     * @throw std::logic_error when no write message is open
     */
    auto payload(std::string_view encoded) -> void;

    /// @brief Terminate the write message if one was opened.
    auto close() -> void;

    auto request_read() -> void;
    auto request_ack() -> void;

    auto is_open() const -> bool
    {
        return open_;
    }
};

} // namespace osc52
