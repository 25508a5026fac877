#include "osc52/reply.hpp"

#include "osc52/errors.hpp"

#include <base64.hpp>

#include <array>
#include <cstddef>

namespace osc52 {

namespace {

constexpr std::string_view ack_tag = "1+r";
constexpr std::string_view clipboard_tag = "52;";

/// @brief Split off the first n-1 ';' separated fields, leaving the rest in the last
template <std::size_t N>
auto split_fields(std::string_view str, std::array<std::string_view, N>& fields) -> std::size_t
{
    std::size_t n = 0;
    while (n + 1 < N)
    {
        auto const semi = str.find(';');
        if (semi == std::string_view::npos) break;
        fields[n++] = str.substr(0, semi);
        str.remove_prefix(semi + 1);
    }
    fields[n++] = str;
    return n;
}

auto decode_clipboard(std::string_view const payload, boost::system::error_code& ec) -> Reply
{
    std::array<std::string_view, 3> fields;
    if (split_fields(payload, fields) < fields.size())
    {
        return ClipboardReply{};
    }

    auto const encoded = fields[2];
    std::string decoded(base64::decoded_size(encoded.size()), '\0');
    auto const last = base64::decode(encoded, decoded.data());
    if (nullptr == last)
    {
        ec = Errc::InvalidEncodedData;
        return UnrecognizedReply{};
    }
    decoded.resize(last - decoded.data());
    return ClipboardReply{std::move(decoded)};
}

} // namespace

auto decode_reply(EscapeKind const kind, std::string_view const payload, boost::system::error_code& ec) -> Reply
{
    ec = {};

    switch (kind)
    {
    case EscapeKind::Dcs:
        if (payload.starts_with(ack_tag))
        {
            return AckReply{};
        }
        break;

    case EscapeKind::Osc:
        if (payload.starts_with(clipboard_tag))
        {
            return decode_clipboard(payload, ec);
        }
        break;
    }

    return UnrecognizedReply{};
}

} // namespace osc52
