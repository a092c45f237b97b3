#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "proto/integrity.hpp"
#include "util/log.hpp"

using namespace integrity;

static Bytes to_bytes(const std::string &s)
{
    return Bytes(s.begin(), s.end());
}

TEST(Integrity, Crc32EmptyIsZero)
{
    EXPECT_EQ(crc32(Bytes{}), 0u);
    EXPECT_EQ(crc32(nullptr, 0), 0u);
}

TEST(Integrity, Crc32CheckValue)
{
    // standard CRC-32 check value
    EXPECT_EQ(crc32(to_bytes("123456789")), 0xCBF43926u);
    EXPECT_EQ(crc32(to_bytes("hello")), 0x3610A686u);
}

TEST(Integrity, Crc32DetectsSingleBitFlip)
{
    Bytes data = to_bytes("voice payload");
    auto  a    = crc32(data);
    data[3] ^= 0x01;
    EXPECT_NE(crc32(data), a);
}

TEST(Integrity, Base64KnownVectors)
{
    EXPECT_EQ(encode_binary_safe(Bytes{}), "");
    EXPECT_EQ(encode_binary_safe(to_bytes("f")), "Zg==");
    EXPECT_EQ(encode_binary_safe(to_bytes("fo")), "Zm8=");
    EXPECT_EQ(encode_binary_safe(to_bytes("foo")), "Zm9v");
    EXPECT_EQ(encode_binary_safe(to_bytes("hello")), "aGVsbG8=");
}

TEST(Integrity, Base64DecodesBinary)
{
    Bytes raw;
    for (int i = 0; i < 256; ++i)
        raw.push_back(static_cast<std::uint8_t>(i));
    const std::string text = encode_binary_safe(raw);
    EXPECT_EQ(text.size(), encoded_size(raw.size()));

    auto back = decode_binary_safe(text);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, raw);
}

TEST(Integrity, Base64EmptyDecodesToEmpty)
{
    auto back = decode_binary_safe("");
    ASSERT_TRUE(back.has_value());
    EXPECT_TRUE(back->empty());
}

TEST(Integrity, Base64RejectsMalformed)
{
    voxmesh::set_log_level(voxmesh::Level::Debug);

    testing::internal::CaptureStderr();
    EXPECT_FALSE(decode_binary_safe("abc").has_value());  // not a multiple of 4
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("decode_binary_safe"), std::string::npos);

    EXPECT_FALSE(decode_binary_safe("ab!=").has_value());
    EXPECT_FALSE(decode_binary_safe("a===").has_value());
    EXPECT_FALSE(decode_binary_safe("Zg==Zg==").has_value());  // padding mid-stream
}

TEST(Integrity, EncodedSize)
{
    EXPECT_EQ(encoded_size(0), 0u);
    EXPECT_EQ(encoded_size(1), 4u);
    EXPECT_EQ(encoded_size(2), 4u);
    EXPECT_EQ(encoded_size(3), 4u);
    EXPECT_EQ(encoded_size(306), 408u);
}
