#pragma once
#include <cstdint>

namespace audio
{

// Reduction applied by Codec::compress. Zero leaves that property as recorded;
// the rate is only ever lowered and the sample width only ever narrowed.
struct Quality
{
    std::uint32_t max_rate{0};
    std::uint16_t sample_width{0};

    bool operator==(const Quality &o) const
    {
        return max_rate == o.max_rate && sample_width == o.sample_width;
    }
};

}  // namespace audio
