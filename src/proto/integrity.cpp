#include <sodium.h>
#include <zlib.h>

#include "proto/integrity.hpp"
#include "util/log.hpp"

namespace integrity
{

static_assert(encoded_size(0) == 0 && encoded_size(1) == 4 && encoded_size(3) == 4 &&
                  encoded_size(4) == 8,
              "base64 size formula");

std::uint32_t crc32(const std::uint8_t *data, std::size_t len)
{
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in slices
    while (len > 0)
    {
        const uInt take = len > 0x40000000u ? 0x40000000u : static_cast<uInt>(len);
        crc             = ::crc32(crc, data, take);
        data += take;
        len -= take;
    }
    return static_cast<std::uint32_t>(crc & 0xffffffffUL);
}

std::uint32_t crc32(const Bytes &data)
{
    return crc32(data.data(), data.size());
}

std::string encode_binary_safe(const Bytes &raw)
{
    const int         variant = sodium_base64_VARIANT_ORIGINAL;
    const std::size_t cap     = sodium_base64_ENCODED_LEN(raw.size(), variant);  // incl. NUL
    std::string       out(cap, '\0');
    sodium_bin2base64(out.data(), out.size(), raw.data(), raw.size(), variant);
    out.resize(cap - 1);
    return out;
}

std::optional<Bytes> decode_binary_safe(std::string_view text)
{
    if (text.size() % 4 != 0)
    {
        LOG_WARN("decode_binary_safe: bad length %zu (not a multiple of 4)", text.size());
        return std::nullopt;
    }
    Bytes       out(text.size() / 4 * 3);
    std::size_t real_len = 0;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &real_len,
                          nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        LOG_WARN("decode_binary_safe: malformed base64 (%zu chars)", text.size());
        return std::nullopt;
    }
    out.resize(real_len);
    return out;
}

}  // namespace integrity
