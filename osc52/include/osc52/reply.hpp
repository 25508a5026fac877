#pragma once
/**
 * @file reply.hpp
 * @brief Classification of escape sequence replies from the terminal
 *
 */

#include "loop.hpp"

#include <boost/system/error_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace osc52 {

/// @brief DCS reply starting with "1+r": the terminal processed everything sent before the ack request
struct AckReply
{
    friend auto operator==(AckReply const&, AckReply const&) -> bool = default;
};

/// @brief OSC reply starting with "52;"
struct ClipboardReply
{
    /// Decoded selection contents, or nothing when the terminal declined the request
    std::optional<std::string> payload;

    friend auto operator==(ClipboardReply const&, ClipboardReply const&) -> bool = default;
};

/// @brief Unrelated escape traffic
struct UnrecognizedReply
{
    friend auto operator==(UnrecognizedReply const&, UnrecognizedReply const&) -> bool = default;
};

using Reply = std::variant<UnrecognizedReply, AckReply, ClipboardReply>;

/**
 * @brief Classify a reply delivered by the loop
 *
 * A clipboard reply is split on ';' into at most three fields. Fewer
 * than three fields is how terminals without clipboard access answer,
 * so that is a ClipboardReply without payload rather than an error.
 * A third field that isn't valid base64 sets ec to
 * Errc::InvalidEncodedData and returns UnrecognizedReply.
 *
 * @param kind Envelope the payload arrived in
 * @param payload Text between the introducer and the string terminator
 * @param ec Set on failure
 * @return Classified reply
 */
auto decode_reply(EscapeKind kind, std::string_view payload, boost::system::error_code& ec) -> Reply;

} // namespace osc52
