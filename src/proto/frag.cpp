#include <algorithm>
#include <cstdint>

#include "proto/envelope.hpp"
#include "proto/frag.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace frag
{

std::size_t chunk_overhead(std::size_t data_len)
{
    const auto widest = static_cast<std::uint32_t>(
        std::min<std::size_t>(std::max<std::size_t>(data_len, 1), MAX_TOTAL_CHUNKS));

    envelope::ChunkEnvelope sample;
    sample.chunk_id     = std::string(constants::CHUNK_ID_LEN, '0');
    sample.chunk_num    = widest;
    sample.total_chunks = widest;
    sample.crc32        = UINT32_MAX;
    // data left empty: measure framing only
    return envelope::serialize(sample).size();
}

std::optional<std::size_t> max_raw_per_chunk(std::size_t data_len, std::size_t wire_budget)
{
    const std::size_t overhead = chunk_overhead(data_len);
    if (wire_budget <= overhead)
    {
        LOG_ERROR("max_raw_per_chunk: budget %zu <= envelope overhead %zu", wire_budget, overhead);
        return std::nullopt;
    }
    // base64 emits 4 chars per 3 raw bytes; only whole quanta fit
    const std::size_t b64_budget = wire_budget - overhead;
    const std::size_t max_raw    = (b64_budget / 4) * 3;
    if (max_raw < MIN_RAW_PER_CHUNK)
    {
        LOG_ERROR("max_raw_per_chunk: budget %zu leaves %zu raw bytes/chunk (min %zu)",
                  wire_budget, max_raw, MIN_RAW_PER_CHUNK);
        return std::nullopt;
    }
    return max_raw;
}

std::optional<std::vector<Bytes>> split(const Bytes &data, std::size_t wire_budget)
{
    std::vector<Bytes> out;
    if (data.empty())
    {
        LOG_DEBUG("split: empty payload, nothing to send");
        return out;
    }

    const auto max_raw = max_raw_per_chunk(data.size(), wire_budget);
    if (!max_raw)
        return std::nullopt;

    const std::size_t num_chunks = (data.size() + *max_raw - 1) / *max_raw;
    if (num_chunks > MAX_TOTAL_CHUNKS)
    {
        LOG_ERROR("split: payload too large (%zu bytes, needs %zu chunks)", data.size(),
                  num_chunks);
        return std::nullopt;
    }

    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        const std::size_t start = i * *max_raw;
        const std::size_t take  = std::min(*max_raw, data.size() - start);
        out.emplace_back(data.begin() + start, data.begin() + start + take);
    }

    LOG_DEBUG("split: %zu bytes -> %zu chunks (budget=%zu, raw/chunk=%zu)", data.size(),
              num_chunks, wire_budget, *max_raw);
    return out;
}

}  // namespace frag
