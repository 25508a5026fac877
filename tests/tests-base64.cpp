#include <base64.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

auto decode_string_view(std::string_view const input, char * const output) -> std::string_view
{
    auto const last = base64::decode(input, output);
    return last ? std::string_view{output, last} : std::string_view{};
}

auto encode(std::string_view const input) -> std::string
{
    std::string output(base64::encoded_size(input.size()), 0);
    base64::encode(input, output.data());
    return output;
}

/// Stream input through an Encoder in pieces of the given sizes, cycling through them
auto encode_chunked(std::string_view input, std::vector<std::size_t> const& sizes) -> std::string
{
    base64::Encoder encoder;
    std::string output;
    for (std::size_t i = 0; not input.empty(); i++)
    {
        auto const n = std::min(sizes[i % sizes.size()], input.size());
        encoder.write(input.substr(0, n), output);
        input.remove_prefix(n);
    }
    encoder.close(output);
    return output;
}

TEST(Base64, EncodeFoobar)
{
    EXPECT_STREQ(encode("").c_str(), "");
    EXPECT_STREQ(encode("f").c_str(), "Zg==");
    EXPECT_STREQ(encode("fo").c_str(), "Zm8=");
    EXPECT_STREQ(encode("foo").c_str(), "Zm9v");
    EXPECT_STREQ(encode("foob").c_str(), "Zm9vYg==");
    EXPECT_STREQ(encode("fooba").c_str(), "Zm9vYmE=");
    EXPECT_STREQ(encode("foobar").c_str(), "Zm9vYmFy");
}


TEST(Base64, DecodeFoobar)
{
    char buffer[6];

    ASSERT_EQ(decode_string_view("", buffer), "");
    ASSERT_EQ(decode_string_view("Zg==", buffer), "f");
    ASSERT_EQ(decode_string_view("Zm8=", buffer), "fo");
    ASSERT_EQ(decode_string_view("Zm9v", buffer), "foo");
    ASSERT_EQ(decode_string_view("Zm9vYg==", buffer), "foob");
    ASSERT_EQ(decode_string_view("Zm9vYmE=", buffer), "fooba");
    ASSERT_EQ(decode_string_view("Zm9vYmFy", buffer), "foobar");
}

TEST(Base64, Exhaust1)
{
    for (int i = std::numeric_limits<char>::min();
         i <= std::numeric_limits<char>::max();
         i++)
    {
        char input[1] {char(i)};
        char output64[5] {};
        char recovered[1];

        base64::encode({input, 1}, output64);
        ASSERT_EQ(base64::decode(output64, recovered), recovered+1);
        EXPECT_EQ(recovered[0], input[0]);
    }
}

TEST(Base64, Zeros) {
    char buffer[6];

    ASSERT_EQ(decode_string_view("AA==", buffer), std::string_view("\0", 1));
    ASSERT_EQ(decode_string_view("AAA=", buffer), std::string_view("\0\0", 2));
    ASSERT_EQ(decode_string_view("AAAA", buffer), std::string_view("\0\0\0", 3));
}

TEST(Base64, Ones) {
    uint32_t buffer = UINT32_C(0xffffffff);
    char output[9] {};

    base64::encode({reinterpret_cast<char*>(&buffer), sizeof(buffer)}, output);
    EXPECT_STREQ(output, "/////w==");

    uint32_t decoded {};
    ASSERT_EQ(base64::decode(output, reinterpret_cast<char*>(&decoded)), reinterpret_cast<char*>(&decoded) + 4);

    ASSERT_EQ(decoded, UINT32_C(0xffffffff));
}

TEST(Base64, Junk) {
    char buffer[6];

    char input[] = "AAAAAAAA";
    input[2] = -128;
    EXPECT_EQ(base64::decode({input, 8}, buffer), nullptr);

    input[2] = 'A';
    input[4] = 0;
    EXPECT_EQ(base64::decode({input, 8}, buffer), nullptr);

    EXPECT_EQ(base64::decode("Zm9v\nYmFy", buffer), nullptr);
    EXPECT_EQ(base64::decode("Zm9v;YmF", buffer), nullptr);
}

TEST(Base64, Unpadded) {
    char buffer[6];

    EXPECT_EQ(base64::decode("Zg", buffer), nullptr);
    EXPECT_EQ(base64::decode("Zm8", buffer), nullptr);
    EXPECT_EQ(base64::decode("Zm9vY", buffer), nullptr);
}

TEST(Base64, MisplacedPadding) {
    char buffer[6];

    EXPECT_EQ(base64::decode("Z===", buffer), nullptr);
    EXPECT_EQ(base64::decode("====", buffer), nullptr);
    EXPECT_EQ(base64::decode("Zg==Zm8=", buffer), nullptr);
    EXPECT_EQ(base64::decode("Z=g=", buffer), nullptr);
}

TEST(Base64Encoder, MatchesOneShot)
{
    std::string input;
    for (int i = 0; i < 1000; i++)
    {
        input.push_back(char(i * 7 + 3));
    }

    for (std::size_t len = 0; len <= 20; len++)
    {
        auto const prefix = std::string_view{input}.substr(0, len);
        auto const expect = encode(prefix);
        EXPECT_EQ(encode_chunked(prefix, {1}), expect) << "len " << len;
        EXPECT_EQ(encode_chunked(prefix, {2}), expect) << "len " << len;
        EXPECT_EQ(encode_chunked(prefix, {3}), expect) << "len " << len;
        EXPECT_EQ(encode_chunked(prefix, {1, 5, 2}), expect) << "len " << len;
    }

    auto const expect = encode(input);
    EXPECT_EQ(encode_chunked(input, {1000}), expect);
    EXPECT_EQ(encode_chunked(input, {7, 11, 1, 13}), expect);
    EXPECT_EQ(encode_chunked(input, {8192}), expect);
}

TEST(Base64Encoder, EmitsCompleteGroupsEagerly)
{
    base64::Encoder encoder;
    std::string output;

    encoder.write("fo", output);
    EXPECT_EQ(output, "");

    encoder.write("ob", output);
    EXPECT_EQ(output, "Zm9v");

    encoder.write("ar", output);
    EXPECT_EQ(output, "Zm9vYmFy");

    encoder.close(output);
    EXPECT_EQ(output, "Zm9vYmFy");
}

TEST(Base64Encoder, ClosePads)
{
    base64::Encoder encoder;
    std::string output;

    encoder.write("foob", output);
    EXPECT_EQ(output, "Zm9v");
    encoder.close(output);
    EXPECT_EQ(output, "Zm9vYg==");
    EXPECT_TRUE(encoder.is_closed());
}

TEST(Base64Encoder, EmptyInput)
{
    base64::Encoder encoder;
    std::string output;

    encoder.write("", output);
    encoder.close(output);
    EXPECT_EQ(output, "");
}

TEST(Base64Encoder, WriteAfterClose)
{
    base64::Encoder encoder;
    std::string output;

    encoder.close(output);
    EXPECT_THROW(encoder.write("x", output), std::logic_error);
    EXPECT_THROW(encoder.close(output), std::logic_error);
}

} // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
