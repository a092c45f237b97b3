#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "audio/quality.hpp"
#include "util/constants.hpp"

namespace config
{

using std::chrono::milliseconds;
using std::chrono::seconds;

inline constexpr std::size_t FALLBACK_BUDGET = 180;

struct PacingSettings
{
    milliseconds base{1000};
    milliseconds per_byte{5};
    milliseconds max{5000};
};

struct Settings
{
    // wire-size budget per named tier
    std::map<std::string, std::size_t> tiers{{"Small", 150}, {"Medium", 180}, {"Large", 200}};
    std::string                        default_tier{"Medium"};

    // audio reduction per named quality; "UltraLow" also narrows to 8-bit samples
    std::map<std::string, audio::Quality> qualities{
        {"UltraLow", {4000, 1}}, {"VeryLow", {8000, 0}}, {"Low", {11025, 0}}};
    std::string default_quality{"Low"};

    int           retry_count{2};
    milliseconds  retry_delay{1000};
    seconds       receive_timeout{60};
    std::uint16_t app_port{constants::DEFAULT_APP_PORT};

    PacingSettings pacing{};

    // single-flight guard waits
    milliseconds chunked_lock_wait{5000};
    milliseconds single_lock_wait{1000};

    // drop inbound packets whose sender is our own node id
    bool ignore_loopback{true};

    // Budget for a tier; unknown names fall back to the default tier, then FALLBACK_BUDGET
    std::size_t budget_for(const std::string &tier) const;
    std::size_t default_budget() const { return budget_for(default_tier); }

    // Unknown names fall back to the default quality, then to no reduction
    audio::Quality quality_for(const std::string &name) const;
};

// Parse "Small=150,Medium=180" style tier tables. nullopt on any malformed entry.
std::optional<std::map<std::string, std::size_t>> parse_tiers(const std::string &table);

// Defaults overlaid with VOXMESH_* environment variables
Settings from_env();

}  // namespace config
