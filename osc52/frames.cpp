#include "osc52/frames.hpp"

#include "osc52/loop.hpp"

#include <stdexcept>

namespace osc52 {

auto target_code(Target const target) -> char
{
    switch (target)
    {
    case Target::Primary: return 'p';
    case Target::Clipboard: return 'c';
    }
    return 'c';
}

auto write_open(Target const target) -> std::string
{
    std::string frame {"\x1b]52;"};
    frame += target_code(target);
    frame += ';';
    return frame;
}

auto read_request(Target const target) -> std::string
{
    auto frame = write_open(target);
    frame += '?';
    frame += string_terminator;
    return frame;
}

auto FrameEmitter::open() -> void
{
    if (not open_ && not closed_)
    {
        loop_.write(write_open(target_));
        open_ = true;
    }
}

auto FrameEmitter::payload(std::string_view const encoded) -> void
{
    if (not open_)
    {
        throw std::logic_error{"osc52: payload outside of a write frame"};
    }
    if (not encoded.empty())
    {
        loop_.write(encoded);
    }
}

auto FrameEmitter::close() -> void
{
    if (open_)
    {
        loop_.write(string_terminator);
        open_ = false;
        closed_ = true;
    }
}

auto FrameEmitter::request_read() -> void
{
    loop_.write(read_request(target_));
}

auto FrameEmitter::request_ack() -> void
{
    loop_.write(ack_request);
}

} // namespace osc52
