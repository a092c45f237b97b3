#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace integrity
{

using Bytes = std::vector<std::uint8_t>;

// CRC-32 (IEEE 802.3, same as zlib) masked to 32 bits; crc32({}) == 0
std::uint32_t crc32(const std::uint8_t *data, std::size_t len);
std::uint32_t crc32(const Bytes &data);

// Standard padded base64. decode returns nullopt on malformed input.
std::string          encode_binary_safe(const Bytes &raw);
std::optional<Bytes> decode_binary_safe(std::string_view text);

// Encoded length of n raw bytes (no terminator): 4 * ceil(n / 3)
constexpr std::size_t encoded_size(std::size_t n)
{
    return ((n + 2) / 3) * 4;
}

}  // namespace integrity
