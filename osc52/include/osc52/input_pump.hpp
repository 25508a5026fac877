#pragma once
/**
 * @file input_pump.hpp
 * @brief Streams the local payload through the base64 encoder
 *
 */

#include <base64.hpp>

#include <boost/system/error_code.hpp>

#include <array>
#include <cstddef>
#include <span>
#include <string>

namespace osc52 {

/**
 * @brief Payload source for a clipboard write
 *
 * read_some follows the Boost.Asio convention: end of stream is
 * reported as boost::asio::error::eof and "no data yet" as
 * boost::asio::error::would_block.
 */
class Source
{
public:
    virtual ~Source() = default;

    /// @brief True when the source is a live terminal rather than piped data
    virtual auto interactive() const -> bool = 0;

    virtual auto read_some(std::span<char> buffer, boost::system::error_code& ec) -> std::size_t = 0;
};

enum class PumpStatus
{
    Data,     ///< a chunk was read and encoded; pull again
    Pending,  ///< nothing available right now; pull again once woken up
    Finished, ///< end of stream reached and encoder flushed
};

class InputPump
{
public:
    static std::size_t const chunk_size = 8192;

private:
    Source& source_;
    base64::Encoder encoder_;
    std::array<char, chunk_size> buffer_;
    bool finished_;

public:
    InputPump(Source& source)
        : source_{source}
        , encoder_{}
        , buffer_{}
        , finished_{false}
    {
    }

    InputPump(InputPump const&) = delete;
    auto operator=(InputPump const&) -> InputPump& = delete;

    /**
     * @brief Read at most one chunk and encode it
     *
     * An interactive source is never read; it finishes immediately
     * with an empty payload. A read error finishes the pump and is
     * reported through ec.
     *
     * @param output Encoded text is appended here
     * @param ec Set on read failure
     * @return What the caller should do next
     */
    auto pull(std::string& output, boost::system::error_code& ec) -> PumpStatus;

    auto finished() const -> bool
    {
        return finished_;
    }

    auto interactive() const -> bool
    {
        return source_.interactive();
    }
};

} // namespace osc52
