#include "base64.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace base64 {

namespace {

    constexpr auto alphabet = std::array<char, 64>{
        'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P',
        'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f',
        'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v',
        'w', 'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'
    };

    constexpr auto alphabet_values = []() constexpr -> std::array<std::int8_t, 256> {
        std::array<std::int8_t, 256> result;
        result.fill(-1);
        std::int8_t v = 0;
        for (auto const k : alphabet)
        {
            result[k] = v++;
        }
        return result;
    }();

    /// @brief Append the encoding of input to the end of output
    auto append_encoded(std::string& output, std::string_view const input) -> void
    {
        if (input.empty()) return;
        auto const start = output.size();
        output.resize(start + encoded_size(input.size()));
        encode(input, output.data() + start);
    }

}

static_assert(CHAR_BIT == 8);

auto encode(std::string_view const input, char* output) -> void
{
    auto cursor = std::begin(input);
    auto const end = std::end(input);

    std::uint32_t buffer;

    auto const extract = [&buffer](int const i) -> char {
        return alphabet[0x3f & buffer >> 6 * i];
    };

    while (std::distance(cursor, end) >= std::ptrdiff_t(3))
    {
        buffer  = static_cast<std::uint8_t>(*cursor++) << 8 * 2;
        buffer |= static_cast<std::uint8_t>(*cursor++) << 8 * 1;
        buffer |= static_cast<std::uint8_t>(*cursor++) << 8 * 0;

        *output++ = extract(3);
        *output++ = extract(2);
        *output++ = extract(1);
        *output++ = extract(0);
    }

    if (cursor < end)
    {
        buffer = static_cast<std::uint8_t>(*cursor++) << (8 * 2 - 6);
        if (cursor < end)
            buffer |= static_cast<std::uint8_t>(*cursor) << (8 * 1 - 6);

        *output++ = extract(2);
        *output++ = extract(1);
        *output++ = cursor < end ? extract(0) : '=';
        *output++ = '=';
    }
}

auto decode(std::string_view input, char* output) -> char*
{
    if (input.size() % 4 != 0)
    {
        return nullptr; // unpadded or truncated
    }

    // strip up to two pad characters; any other '=' fails the lookup below
    for (int i = 0; i < 2 && not input.empty() && input.back() == '='; i++)
    {
        input.remove_suffix(1);
    }

    std::uint32_t buffer = 1;

    auto const filled = [&buffer](int const i) -> bool {
        return buffer >> 6 * i;
    };

    for (auto const c : input)
    {
        auto const value = alphabet_values[static_cast<std::uint8_t>(c)];
        if (-1 == value)
        {
            return nullptr;
        }

        buffer = buffer << 6 | value;
        if (filled(4))
        {
            *output++ = buffer >> 8 * 2;
            *output++ = buffer >> 8 * 1;
            *output++ = buffer >> 8 * 0;
            buffer = 1;
        }
    }

    if (filled(3))
    {
        buffer <<= 6 * 1;
        *output++ = buffer >> 8 * 2;
        *output++ = buffer >> 8 * 1;
    }
    else if (filled(2))
    {
        buffer <<= 6 * 2;
        *output++ = buffer >> 8 * 2;
    }
    else if (filled(1))
    {
        return nullptr; // a lone sextet can't encode a byte
    }
    return output;
}

auto Encoder::write(std::string_view input, std::string& output) -> void
{
    if (closed_)
    {
        throw std::logic_error{"base64::Encoder: write after close"};
    }

    // complete a group started by an earlier chunk
    if (held_size_ > 0)
    {
        auto const n = std::min(held_.size() - held_size_, input.size());
        std::copy_n(input.begin(), n, held_.begin() + held_size_);
        held_size_ += n;
        input.remove_prefix(n);

        if (held_size_ < held_.size())
        {
            return;
        }

        append_encoded(output, {held_.data(), held_.size()});
        held_size_ = 0;
    }

    auto const whole = input.size() - input.size() % 3;
    append_encoded(output, input.substr(0, whole));
    input.remove_prefix(whole);

    std::copy(input.begin(), input.end(), held_.begin());
    held_size_ = input.size();
}

auto Encoder::close(std::string& output) -> void
{
    if (closed_)
    {
        throw std::logic_error{"base64::Encoder: close after close"};
    }
    closed_ = true;

    append_encoded(output, {held_.data(), held_size_});
    held_size_ = 0;
}

} // namespace base64
