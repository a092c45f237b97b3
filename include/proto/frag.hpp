#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/*
TX:
service.send_voice(compressed)
  -> split(compressed, wire_budget)           // raw slices sized to fit the budget
     -> for n in 1..total:
          make_chunk(chunk_id, n, total, slice)  // crc32 + base64
            -> serialize(...)                   // <= wire_budget bytes
               -> transport.send(packet)

RX:
transport.on_packet(port, bytes, from)
  -> parse(bytes) -> ChunkEnvelope
     -> ReassemblyEngine::on_chunk_received(env, from)
          -> Completed ? inbox.push(concat(1..total)) -> decompress
*/

namespace frag
{

using Bytes = std::vector<std::uint8_t>;

// Below this many raw bytes per chunk the budget is treated as unusable
inline constexpr std::size_t MIN_RAW_PER_CHUNK = 8;
inline constexpr std::size_t MAX_TOTAL_CHUNKS  = 65535;

// Serialized size of a chunk envelope with an empty data field, using worst-case widths for a
// payload of data_len bytes (8-char id, chunk_num == total_chunks, crc32 == 0xFFFFFFFF)
std::size_t chunk_overhead(std::size_t data_len);

// Largest raw slice whose chunk envelope fits wire_budget; nullopt when below MIN_RAW_PER_CHUNK
std::optional<std::size_t> max_raw_per_chunk(std::size_t data_len, std::size_t wire_budget);

// Slices covering data exactly once, each non-empty. Empty data -> empty vector (nothing to send).
// nullopt when the budget is too small or the payload needs more than MAX_TOTAL_CHUNKS chunks.
std::optional<std::vector<Bytes>> split(const Bytes &data, std::size_t wire_budget);

}  // namespace frag
