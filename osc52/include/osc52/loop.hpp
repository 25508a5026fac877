#pragma once
/**
 * @file loop.hpp
 * @brief What a clipboard transfer needs from the event loop hosting it
 *
 * The loop owns the terminal. It demultiplexes replies and key presses
 * out of the terminal's input and hands them to the transfer, and it
 * queues the transfer's frames for writing without blocking.
 */

#include <string_view>

namespace osc52 {

/// @brief Envelope a terminal reply arrived in
enum class EscapeKind
{
    Dcs, ///< ESC P ... ESC \ (device control string)
    Osc, ///< ESC ] ... ESC \ (operating system command)
};

enum class Key
{
    CtrlC,
    Escape,
    Other,
};

struct KeyEvent
{
    Key key;

    friend auto operator==(KeyEvent const&, KeyEvent const&) -> bool = default;
};

class Loop
{
public:
    virtual ~Loop() = default;

    /**
     * @brief Queue bytes for the terminal
     *
     * Bytes are written in the order they are queued. The call never
     * blocks.
     *
     * @param bytes Data to send; copied before returning
     */
    virtual auto write(std::string_view bytes) -> void = 0;

    /// @brief Arrange for the transfer's on_input to run again.
    virtual auto wakeup() -> void = 0;

    /// @brief Stop the loop once all queued output has been written.
    virtual auto quit() -> void = 0;
};

} // namespace osc52
