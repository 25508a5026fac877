/**
 * @file base64.hpp
 * @brief Base64 encoding and decoding
 *
 * Standard alphabet with padding. Decoding is strict because the
 * data handed to it comes from terminal replies that are either
 * exactly right or not trustworthy at all.
 */
#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace base64 {

/**
 * @brief Calculate the size of the buffer needed to encode a base64 string
 *
 * @param len Length of the input string
 * @return size_t Size of the output buffer needed for base64 encoding
 */
inline constexpr auto encoded_size(std::size_t const len) -> std::size_t
{
    return (len + 2) / 3 * 4;
}

/**
 * @brief Calculate the size of the buffer needed to decode a base64 string
 *
 * @param len Length of the input base64 string
 * @return size_t Size of the output buffer needed for base64 decoding
 */
inline constexpr auto decoded_size(std::size_t const len) -> std::size_t
{
    return (len + 3) / 4 * 3;
}

/**
 * @brief Encode a string into base64
 *
 * @param input input text
 * @param output Target buffer for encoded value
 */
auto encode(std::string_view input, char* output) -> void;

/**
 * @brief Decode a base64 encoded string
 *
 * The input must be padded to a multiple of four characters and
 * contain only alphabet characters followed by at most two '='.
 *
 * @param input Base64 input text
 * @param output Target buffer for decoded value
 * @return pointer to end of output on success, nullptr on invalid input
 */
auto decode(std::string_view input, char* output) -> char*;

/**
 * @brief Incremental base64 encoder
 *
 * Input arrives in chunks of arbitrary size. Every completed group
 * of three input bytes is emitted immediately; at most two bytes are
 * held back until more input arrives or the encoder is closed. The
 * concatenated output is identical to encoding the whole input at once.
 */
class Encoder
{
    std::array<char, 3> held_;
    std::size_t held_size_;
    bool closed_;

public:
    Encoder() : held_{}, held_size_{0}, closed_{false} {}

    /**
     * @brief Encode the next chunk of input
     *
     * @param input Raw bytes
     * @param output Encoded text is appended here
     * @throw std::logic_error when the encoder has been closed
     */
    auto write(std::string_view input, std::string& output) -> void;

    /**
     * @brief Flush held bytes with padding and retire the encoder
     *
     * @param output Final encoded text is appended here
     * @throw std::logic_error when the encoder has been closed
     */
    auto close(std::string& output) -> void;

    auto is_closed() const -> bool
    {
        return closed_;
    }
};

} // namespace base64
