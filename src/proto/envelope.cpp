#include <array>
#include <charconv>
#include <cstdio>
#include <sodium.h>
#include <string>
#include <unordered_map>

#include "proto/envelope.hpp"
#include "proto/integrity.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace envelope
{

namespace
{

constexpr char FIELD_SEP = '|';
constexpr char KV_SEP    = '=';

bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

bool needs_escape(unsigned char c)
{
    return c == '%' || c == FIELD_SEP || c == KV_SEP || c < 0x20 || c > 0x7e;
}

std::string escape(std::string_view in)
{
    static const char hex[] = "0123456789ABCDEF";
    std::string       out;
    out.reserve(in.size());
    for (unsigned char c : in)
    {
        if (needs_escape(c))
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
        else
        {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

int hex_val(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F')
        return 10 + (c - 'A');
    return -1;
}

std::optional<std::string> unescape(std::string_view in)
{
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); i++)
    {
        if (in[i] != '%')
        {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size())
            return std::nullopt;  // truncated escape
        const int hi = hex_val(in[i + 1]);
        const int lo = hex_val(in[i + 2]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

using Fields = std::unordered_map<std::string_view, std::string_view>;

// Splits "k=v|k=v" into fields; rejects empty keys, missing '=' and duplicate keys
std::optional<Fields> split_fields(std::string_view rec, std::string_view &first_key)
{
    Fields      fields;
    std::size_t pos = 0;
    bool        first = true;
    while (pos <= rec.size())
    {
        std::size_t end = rec.find(FIELD_SEP, pos);
        if (end == std::string_view::npos)
            end = rec.size();
        std::string_view item = rec.substr(pos, end - pos);
        std::size_t      eq   = item.find(KV_SEP);
        if (eq == std::string_view::npos || eq == 0)
            return std::nullopt;
        std::string_view key = item.substr(0, eq);
        if (!fields.emplace(key, item.substr(eq + 1)).second)
            return std::nullopt;  // duplicate key
        if (first)
        {
            first_key = key;
            first     = false;
        }
        pos = end + 1;
    }
    return fields;
}

std::optional<std::string_view> get(const Fields &f, std::string_view key)
{
    auto it = f.find(key);
    if (it == f.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::uint32_t> get_u32(const Fields &f, std::string_view key)
{
    auto v = get(f, key);
    if (!v || v->empty())
        return std::nullopt;
    std::uint32_t out = 0;
    auto [p, ec]      = std::from_chars(v->data(), v->data() + v->size(), out, 10);
    if (ec != std::errc() || p != v->data() + v->size())
        return std::nullopt;
    return out;
}

std::optional<std::string> get_text(const Fields &f, std::string_view key)
{
    auto v = get(f, key);
    if (!v)
        return std::nullopt;
    return unescape(*v);
}

void put(std::string &out, std::string_view key, std::string_view value)
{
    if (!out.empty())
        out.push_back(FIELD_SEP);
    out.append(key);
    out.push_back(KV_SEP);
    out.append(value);
}

void put(std::string &out, std::string_view key, std::uint32_t value)
{
    put(out, key, std::string_view(std::to_string(value)));
}

std::optional<Envelope> parse_chunk(const Fields &f)
{
    auto id    = get_text(f, "chunk_id");
    auto num   = get_u32(f, "chunk_num");
    auto total = get_u32(f, "total_chunks");
    auto crc   = get_u32(f, "crc32");
    auto data  = get(f, "data");
    if (!id || !num || !total || !crc || !data)
        return std::nullopt;
    return ChunkEnvelope{std::move(*id), *num, *total, *crc, std::string(*data)};
}

std::optional<Envelope> parse_ack(const Fields &f)
{
    auto id  = get_text(f, "ack_id");
    auto num = get_u32(f, "chunk_num");
    if (!id || !num)
        return std::nullopt;
    return AckEnvelope{std::move(*id), *num};
}

std::optional<Envelope> parse_test(const Fields &f)
{
    auto text = get_text(f, "test");
    if (!text)
        return std::nullopt;
    return TestEnvelope{std::move(*text)};
}

std::optional<Envelope> parse_complete(const Fields &f)
{
    auto crc  = get_u32(f, "crc32");
    auto data = get(f, "voice_data");
    auto ts   = get_text(f, "timestamp");
    if (!crc || !data || !ts)
        return std::nullopt;
    return CompleteVoiceEnvelope{*crc, std::string(*data), std::move(*ts)};
}

}  // namespace

ChunkEnvelope make_chunk(std::string   chunk_id,
                         std::uint32_t chunk_num,
                         std::uint32_t total_chunks,
                         const Bytes  &raw)
{
    ChunkEnvelope c;
    c.chunk_id     = std::move(chunk_id);
    c.chunk_num    = chunk_num;
    c.total_chunks = total_chunks;
    c.crc32        = integrity::crc32(raw);
    c.data         = integrity::encode_binary_safe(raw);
    return c;
}

AckEnvelope make_ack(std::string ack_id, std::uint32_t chunk_num)
{
    return AckEnvelope{std::move(ack_id), chunk_num};
}

TestEnvelope make_test(std::string text)
{
    return TestEnvelope{std::move(text)};
}

CompleteVoiceEnvelope make_complete_voice(const Bytes &raw, std::string timestamp)
{
    CompleteVoiceEnvelope v;
    v.crc32      = integrity::crc32(raw);
    v.voice_data = integrity::encode_binary_safe(raw);
    v.timestamp  = std::move(timestamp);
    return v;
}

std::string generate_chunk_id()
{
    ensure_sodium_init();
    std::array<unsigned char, constants::CHUNK_ID_LEN / 2> rnd{};
    randombytes_buf(rnd.data(), rnd.size());
    char hex[constants::CHUNK_ID_LEN + 1];
    sodium_bin2hex(hex, sizeof(hex), rnd.data(), rnd.size());
    return std::string(hex, constants::CHUNK_ID_LEN);
}

Bytes serialize(const Envelope &e)
{
    std::string rec;
    std::visit(overloaded{
                   [&](const ChunkEnvelope &c) {
                       put(rec, "type", TYPE_VOICE_CHUNK);
                       put(rec, "chunk_id", escape(c.chunk_id));
                       put(rec, "chunk_num", c.chunk_num);
                       put(rec, "total_chunks", c.total_chunks);
                       put(rec, "crc32", c.crc32);
                       put(rec, "data", c.data);
                   },
                   [&](const AckEnvelope &a) {
                       put(rec, "type", TYPE_ACK);
                       put(rec, "ack_id", escape(a.ack_id));
                       put(rec, "chunk_num", a.chunk_num);
                   },
                   [&](const TestEnvelope &t) {
                       put(rec, "type", TYPE_TEST);
                       put(rec, "test", escape(t.test));
                   },
                   [&](const CompleteVoiceEnvelope &v) {
                       put(rec, "type", TYPE_COMPLETE_VOICE);
                       put(rec, "crc32", v.crc32);
                       put(rec, "voice_data", v.voice_data);
                       put(rec, "timestamp", escape(v.timestamp));
                   },
               },
               e);
    return Bytes(rec.begin(), rec.end());
}

std::optional<Envelope> parse(const Bytes &wire)
{
    if (wire.empty())
    {
        LOG_WARN("parse: empty payload");
        return std::nullopt;
    }
    std::string_view rec(reinterpret_cast<const char *>(wire.data()), wire.size());

    std::string_view first_key;
    auto             fields = split_fields(rec, first_key);
    if (!fields)
    {
        LOG_WARN("parse: malformed record (%zu bytes): %.40s", wire.size(),
                 std::string(rec.substr(0, 40)).c_str());
        return std::nullopt;
    }
    if (first_key != "type")
    {
        LOG_WARN("parse: record does not start with a type tag");
        return std::nullopt;
    }

    const std::string_view type = fields->at("type");
    std::optional<Envelope> out;
    if (type == TYPE_VOICE_CHUNK)
        out = parse_chunk(*fields);
    else if (type == TYPE_ACK)
        out = parse_ack(*fields);
    else if (type == TYPE_TEST)
        out = parse_test(*fields);
    else if (type == TYPE_COMPLETE_VOICE)
        out = parse_complete(*fields);
    else
    {
        LOG_WARN("parse: unknown type '%.*s'", (int)type.size(), type.data());
        return std::nullopt;
    }

    if (!out)
        LOG_WARN("parse: '%.*s' record missing or invalid fields", (int)type.size(), type.data());
    return out;
}

std::string_view type_name(const Envelope &e)
{
    return std::visit(overloaded{
                          [](const ChunkEnvelope &) { return TYPE_VOICE_CHUNK; },
                          [](const AckEnvelope &) { return TYPE_ACK; },
                          [](const TestEnvelope &) { return TYPE_TEST; },
                          [](const CompleteVoiceEnvelope &) { return TYPE_COMPLETE_VOICE; },
                      },
                      e);
}

Verified verify_chunk(const ChunkEnvelope &c)
{
    auto raw = integrity::decode_binary_safe(c.data);
    if (!raw)
    {
        LOG_WARN("verify_chunk: undecodable data for chunk %u/%u (id=%s)", c.chunk_num,
                 c.total_chunks, c.chunk_id.c_str());
        return {};
    }
    const std::uint32_t calc = integrity::crc32(*raw);
    if (calc != c.crc32)
    {
        LOG_WARN("verify_chunk: CRC mismatch for chunk %u/%u (id=%s): expected %u, got %u",
                 c.chunk_num, c.total_chunks, c.chunk_id.c_str(), c.crc32, calc);
        return {};
    }
    return Verified{true, std::move(raw)};
}

Verified verify_complete(const CompleteVoiceEnvelope &v)
{
    auto raw = integrity::decode_binary_safe(v.voice_data);
    if (!raw)
    {
        LOG_WARN("verify_complete: undecodable voice_data");
        return {};
    }
    const std::uint32_t calc = integrity::crc32(*raw);
    if (calc != v.crc32)
    {
        LOG_WARN("verify_complete: CRC mismatch: expected %u, got %u", v.crc32, calc);
        return {};
    }
    return Verified{true, std::move(raw)};
}

}  // namespace envelope
