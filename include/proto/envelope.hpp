#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/*
Wire record (one per mesh packet), fields joined by '|', type first:

  type=voice_chunk|chunk_id=1f2e3d4c|chunk_num=1|total_chunks=3|crc32=305419896|data=<base64>
  type=ack|ack_id=1f2e3d4c|chunk_num=1
  type=test|test=hello%7Cworld
  type=complete_voice|crc32=0|voice_data=|timestamp=20250101_120000

Free-text values (chunk_id, ack_id, test, timestamp) are %XX-escaped for '%', '|', '=' and
bytes outside 0x20..0x7e. crc32 always covers the raw bytes, never the base64 text.
*/

namespace envelope
{

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::string_view TYPE_VOICE_CHUNK    = "voice_chunk";
inline constexpr std::string_view TYPE_ACK            = "ack";
inline constexpr std::string_view TYPE_TEST           = "test";
inline constexpr std::string_view TYPE_COMPLETE_VOICE = "complete_voice";

struct ChunkEnvelope
{
    std::string   chunk_id;
    std::uint32_t chunk_num{0};
    std::uint32_t total_chunks{0};
    std::uint32_t crc32{0};
    std::string   data;  // base64 of the raw slice

    bool operator==(const ChunkEnvelope &o) const
    {
        return chunk_id == o.chunk_id && chunk_num == o.chunk_num &&
               total_chunks == o.total_chunks && crc32 == o.crc32 && data == o.data;
    }
};

struct AckEnvelope
{
    std::string   ack_id;
    std::uint32_t chunk_num{0};

    bool operator==(const AckEnvelope &o) const
    {
        return ack_id == o.ack_id && chunk_num == o.chunk_num;
    }
};

struct TestEnvelope
{
    std::string test;

    bool operator==(const TestEnvelope &o) const { return test == o.test; }
};

struct CompleteVoiceEnvelope
{
    std::uint32_t crc32{0};
    std::string   voice_data;  // base64 of the raw compressed payload
    std::string   timestamp;

    bool operator==(const CompleteVoiceEnvelope &o) const
    {
        return crc32 == o.crc32 && voice_data == o.voice_data && timestamp == o.timestamp;
    }
};

using Envelope = std::variant<ChunkEnvelope, AckEnvelope, TestEnvelope, CompleteVoiceEnvelope>;

// helper for exhaustive std::visit
template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// --- construction ---
ChunkEnvelope         make_chunk(std::string   chunk_id,
                                 std::uint32_t chunk_num,
                                 std::uint32_t total_chunks,
                                 const Bytes  &raw);
AckEnvelope           make_ack(std::string ack_id, std::uint32_t chunk_num);
TestEnvelope          make_test(std::string text);
CompleteVoiceEnvelope make_complete_voice(const Bytes &raw, std::string timestamp);

// 8 random lowercase hex chars, unique per logical message
std::string generate_chunk_id();

// --- wire ---
Bytes                   serialize(const Envelope &e);
std::optional<Envelope> parse(const Bytes &wire);
std::string_view        type_name(const Envelope &e);

// --- integrity ---
// ok == true only when the base64 decodes and its CRC matches; raw is set only then
struct Verified
{
    bool                 ok{false};
    std::optional<Bytes> raw;
};
Verified verify_chunk(const ChunkEnvelope &c);
Verified verify_complete(const CompleteVoiceEnvelope &v);

}  // namespace envelope
