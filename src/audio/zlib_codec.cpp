#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <zlib.h>

#include "audio/zlib_codec.hpp"
#include "util/log.hpp"

namespace audio
{

namespace
{
constexpr std::size_t INFLATE_STEP = 16 * 1024;

bool parse_field(const std::string &s, unsigned long lo, unsigned long hi, unsigned long &out)
{
    if (s.empty())
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &p, 10);
    if (!p || *p != '\0' || v < lo || v > hi)
        return false;
    out = v;
    return true;
}

// little-endian sample of `w` bytes, scaled to the full 32-bit range
std::int32_t load_sample(const std::uint8_t *p, unsigned w)
{
    std::uint32_t u = 0;
    for (unsigned i = 0; i < w; ++i)
        u |= static_cast<std::uint32_t>(p[i]) << (8 * (4 - w + i));
    return static_cast<std::int32_t>(u);
}

// keeps the top `w` bytes of a 32-bit scaled sample
void store_sample(std::uint8_t *p, unsigned w, std::int32_t v)
{
    const auto u = static_cast<std::uint32_t>(v);
    for (unsigned i = 0; i < w; ++i)
        p[i] = static_cast<std::uint8_t>(u >> (8 * (4 - w + i)));
}
}  // namespace

// ======================================================================
// Function: reduce
// - In: recorded pcm, requested quality
// - Out: pcm at min(rate, q.max_rate) and min(width, q.sample_width)
// - Note: narrowing truncates the low bytes
// ======================================================================
Pcm reduce(const Pcm &pcm, const Quality &q)
{
    const unsigned    ch    = pcm.format.channels;
    const unsigned    w_in  = pcm.format.sample_width;
    const std::size_t frame = static_cast<std::size_t>(ch) * w_in;
    if (frame == 0 || w_in > 4)
    {
        LOG_WARN("reduce: unsupported format %s, left as is", format_header(pcm.format).c_str());
        return pcm;
    }

    const std::size_t frames_in = pcm.samples.size() / frame;
    if (pcm.samples.size() % frame)
        LOG_WARN("reduce: dropping %zu bytes of a partial frame", pcm.samples.size() % frame);

    const std::uint32_t rate_in  = pcm.format.rate;
    const std::uint32_t rate_out = (q.max_rate && q.max_rate < rate_in) ? q.max_rate : rate_in;
    const unsigned      w_out    = (q.sample_width && q.sample_width < w_in) ? q.sample_width
                                                                             : w_in;

    std::size_t frames_out = frames_in;
    if (rate_out != rate_in)
        frames_out = static_cast<std::size_t>(static_cast<std::uint64_t>(frames_in) * rate_out /
                                              rate_in);

    Pcm out;
    out.format              = pcm.format;
    out.format.rate         = rate_out;
    out.format.sample_width = static_cast<std::uint16_t>(w_out);
    out.samples.resize(frames_out * ch * w_out);

    const std::uint8_t *src = pcm.samples.data();
    for (std::size_t i = 0; i < frames_out; ++i)
    {
        // output frame i on the input time axis
        const double      pos  = static_cast<double>(i) * rate_in / rate_out;
        const std::size_t i0   = std::min(static_cast<std::size_t>(pos), frames_in - 1);
        const std::size_t i1   = std::min(i0 + 1, frames_in - 1);
        const double      frac = pos - static_cast<double>(i0);
        for (unsigned c = 0; c < ch; ++c)
        {
            const double a = load_sample(src + i0 * frame + c * w_in, w_in);
            const double b = load_sample(src + i1 * frame + c * w_in, w_in);
            const auto   v = static_cast<std::int32_t>(std::lround(a + (b - a) * frac));
            store_sample(out.samples.data() + (i * ch + c) * w_out, w_out, v);
        }
    }
    if (rate_out != rate_in || w_out != w_in)
        LOG_DEBUG("reduce: %s -> %s (%zu -> %zu bytes)", format_header(pcm.format).c_str(),
                  format_header(out.format).c_str(), pcm.samples.size(), out.samples.size());
    return out;
}

std::string format_header(const AudioFormat &f)
{
    return std::to_string(f.rate) + "," + std::to_string(f.channels) + "," +
           std::to_string(f.sample_width);
}

std::optional<AudioFormat> parse_format(const std::string &hdr)
{
    const auto c1 = hdr.find(',');
    if (c1 == std::string::npos)
        return std::nullopt;
    const auto c2 = hdr.find(',', c1 + 1);
    if (c2 == std::string::npos || hdr.find(',', c2 + 1) != std::string::npos)
        return std::nullopt;

    unsigned long rate = 0, ch = 0, width = 0;
    if (!parse_field(hdr.substr(0, c1), 1, 384000, rate) ||
        !parse_field(hdr.substr(c1 + 1, c2 - c1 - 1), 1, 32, ch) ||
        !parse_field(hdr.substr(c2 + 1), 1, 4, width))
        return std::nullopt;

    AudioFormat f;
    f.rate         = static_cast<std::uint32_t>(rate);
    f.channels     = static_cast<std::uint16_t>(ch);
    f.sample_width = static_cast<std::uint16_t>(width);
    return f;
}

std::optional<Bytes> ZlibCodec::compress(const Pcm &recorded, const Quality &q) const
{
    const Pcm         pcm = reduce(recorded, q);
    const std::string hdr = format_header(pcm.format);
    if (hdr.size() > 255)
    {
        LOG_ERROR("compress: header '%s' exceeds 255 bytes", hdr.c_str());
        return std::nullopt;
    }

    Bytes plain;
    plain.reserve(1 + hdr.size() + pcm.samples.size());
    plain.push_back(static_cast<std::uint8_t>(hdr.size()));
    plain.insert(plain.end(), hdr.begin(), hdr.end());
    plain.insert(plain.end(), pcm.samples.begin(), pcm.samples.end());

    uLongf bound = compressBound(static_cast<uLong>(plain.size()));
    Bytes  out(bound);
    int    rc = compress2(out.data(), &bound, plain.data(), static_cast<uLong>(plain.size()),
                          level_);
    if (rc != Z_OK)
    {
        LOG_ERROR("compress: zlib error %d", rc);
        return std::nullopt;
    }
    out.resize(bound);
    LOG_DEBUG("compress: %zu pcm bytes -> %zu (%s)", recorded.samples.size(), out.size(),
              hdr.c_str());
    return out;
}

// ======================================================================
// Function: ZlibCodec::decompress
// - In: zlib blob produced by compress()
// - Out: format + samples; nullopt on zlib error, size cap, bad header
// ======================================================================
std::optional<Pcm> ZlibCodec::decompress(const Bytes &blob) const
{
    if (blob.empty())
    {
        LOG_WARN("decompress: empty input");
        return std::nullopt;
    }

    z_stream zs{};
    if (inflateInit(&zs) != Z_OK)
    {
        LOG_ERROR("decompress: inflateInit failed");
        return std::nullopt;
    }
    zs.next_in  = const_cast<Bytef *>(blob.data());
    zs.avail_in = static_cast<uInt>(blob.size());

    Bytes plain;
    int   rc = Z_OK;
    while (rc == Z_OK)
    {
        if (plain.size() >= MAX_DECOMPRESSED)
        {
            inflateEnd(&zs);
            LOG_WARN("decompress: output exceeds %zu bytes", MAX_DECOMPRESSED);
            return std::nullopt;
        }
        const std::size_t have = plain.size();
        plain.resize(have + INFLATE_STEP);
        zs.next_out  = plain.data() + have;
        zs.avail_out = static_cast<uInt>(INFLATE_STEP);
        rc           = inflate(&zs, Z_NO_FLUSH);
        plain.resize(have + (INFLATE_STEP - zs.avail_out));
        if (rc == Z_BUF_ERROR && zs.avail_in == 0)
            break;  // truncated stream
    }
    // copy the message while the stream is still valid
    const std::string zmsg = zs.msg ? zs.msg : "truncated";
    inflateEnd(&zs);
    if (rc != Z_STREAM_END)
    {
        LOG_WARN("decompress: zlib error %d (%s)", rc, zmsg.c_str());
        return std::nullopt;
    }

    if (plain.empty() || 1u + plain[0] > plain.size())
    {
        LOG_WARN("decompress: missing audio header");
        return std::nullopt;
    }
    const std::size_t hdr_len = plain[0];
    const std::string hdr(reinterpret_cast<const char *>(plain.data() + 1), hdr_len);
    auto              fmt = parse_format(hdr);
    if (!fmt)
    {
        LOG_WARN("decompress: invalid audio header '%s'", hdr.c_str());
        return std::nullopt;
    }

    Pcm pcm;
    pcm.format = *fmt;
    pcm.samples.assign(plain.begin() + 1 + hdr_len, plain.end());
    LOG_DEBUG("decompress: %zu bytes -> %zu pcm bytes (%s)", blob.size(), pcm.samples.size(),
              hdr.c_str());
    return pcm;
}

}  // namespace audio
