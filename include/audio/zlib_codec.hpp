#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "audio/quality.hpp"

namespace audio
{

using Bytes = std::vector<std::uint8_t>;

struct AudioFormat
{
    std::uint32_t rate{8000};
    std::uint16_t channels{1};
    std::uint16_t sample_width{2};  // bytes per sample

    bool operator==(const AudioFormat &o) const
    {
        return rate == o.rate && channels == o.channels && sample_width == o.sample_width;
    }
};

struct Pcm
{
    AudioFormat format{};
    Bytes       samples;
};

struct Codec
{
    virtual std::optional<Bytes> compress(const Pcm &pcm, const Quality &q) const = 0;
    virtual std::optional<Pcm>   decompress(const Bytes &blob) const                = 0;
    virtual std::string          name() const { return ""; }
    virtual ~Codec() = default;
};

// Blob: zlib( [hdr_len u8]["rate,channels,width"][pcm samples] )
class ZlibCodec final : public Codec
{
  public:
    static constexpr std::size_t MAX_DECOMPRESSED = 16u * 1024u * 1024u;

    explicit ZlibCodec(int level = 9) : level_(level) {}

    std::optional<Bytes> compress(const Pcm &pcm, const Quality &q) const override;
    std::optional<Pcm>   decompress(const Bytes &blob) const override;
    std::string          name() const override { return "zlib"; }

  private:
    int level_;
};

// Downsample (linear interpolation per channel) and narrow samples as `q` asks.
// Samples are little-endian signed integers; a trailing partial frame is dropped.
Pcm reduce(const Pcm &pcm, const Quality &q);

// "8000,1,2" -> AudioFormat; nullopt when malformed or out of range
std::optional<AudioFormat> parse_format(const std::string &hdr);
std::string                format_header(const AudioFormat &f);

}  // namespace audio
