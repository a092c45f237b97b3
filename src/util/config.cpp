#include <cstdlib>
#include <string>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

std::size_t Settings::budget_for(const std::string &tier) const
{
    auto it = tiers.find(tier);
    if (it != tiers.end())
        return it->second;

    LOG_WARN("[CFG] unknown tier '%s', using default '%s'", tier.c_str(), default_tier.c_str());
    it = tiers.find(default_tier);
    if (it != tiers.end())
        return it->second;
    return FALLBACK_BUDGET;
}

audio::Quality Settings::quality_for(const std::string &name) const
{
    auto it = qualities.find(name);
    if (it != qualities.end())
        return it->second;

    if (!name.empty())
        LOG_WARN("[CFG] unknown quality '%s', using default '%s'", name.c_str(),
                 default_quality.c_str());
    it = qualities.find(default_quality);
    if (it != qualities.end())
        return it->second;
    return audio::Quality{};
}

std::optional<std::map<std::string, std::size_t>> parse_tiers(const std::string &table)
{
    std::map<std::string, std::size_t> out;
    std::size_t                        pos = 0;
    while (pos <= table.size())
    {
        std::size_t end = table.find(',', pos);
        if (end == std::string::npos)
            end = table.size();
        const std::string item = table.substr(pos, end - pos);
        const auto        eq   = item.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 >= item.size())
            return std::nullopt;

        const std::string name  = item.substr(0, eq);
        const std::string value = item.substr(eq + 1);
        char             *p     = nullptr;
        unsigned long     v     = std::strtoul(value.c_str(), &p, 10);
        if (!p || *p != '\0' || v == 0 || v > 65535)
            return std::nullopt;
        out[name] = static_cast<std::size_t>(v);
        pos       = end + 1;
    }
    if (out.empty())
        return std::nullopt;
    return out;
}

// Reads an unsigned env value in [lo, hi]; keeps the default and warns otherwise
static bool env_ulong(const char *key, unsigned long lo, unsigned long hi, unsigned long &out)
{
    const char *e = std::getenv(key);
    if (!e)
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (*e == '\0' || !p || *p != '\0' || v < lo || v > hi)
    {
        LOG_WARN("[CFG] ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
        return false;
    }
    out = v;
    return true;
}

Settings from_env()
{
    Settings      s{};
    unsigned long v = 0;

    if (const char *e = std::getenv("VOXMESH_TIERS"))
    {
        if (auto t = parse_tiers(e))
            s.tiers = std::move(*t);
        else
            LOG_WARN("[CFG] ignoring invalid VOXMESH_TIERS='%s' (expect Name=bytes,...)", e);
    }
    if (const char *e = std::getenv("VOXMESH_TIER"); e && *e)
    {
        if (s.tiers.count(e))
            s.default_tier = e;
        else
            LOG_WARN("[CFG] VOXMESH_TIER='%s' not in tier table, keeping '%s'", e,
                     s.default_tier.c_str());
    }
    // keep the default tier resolvable after a tier table override
    if (!s.tiers.count(s.default_tier))
        s.default_tier = s.tiers.begin()->first;

    if (const char *e = std::getenv("VOXMESH_QUALITY"); e && *e)
    {
        if (s.qualities.count(e))
            s.default_quality = e;
        else
            LOG_WARN("[CFG] VOXMESH_QUALITY='%s' not in quality table, keeping '%s'", e,
                     s.default_quality.c_str());
    }

    if (env_ulong("VOXMESH_RETRY_COUNT", 0, 10, v))
        s.retry_count = static_cast<int>(v);
    if (env_ulong("VOXMESH_RETRY_DELAY_MS", 0, 60000, v))
        s.retry_delay = milliseconds(v);
    if (env_ulong("VOXMESH_RX_TIMEOUT_SEC", 1, 3600, v))
        s.receive_timeout = seconds(v);
    if (env_ulong("VOXMESH_APP_PORT", 1, 65535, v))
        s.app_port = static_cast<std::uint16_t>(v);
    if (env_ulong("VOXMESH_PACE_BASE_MS", 0, 60000, v))
        s.pacing.base = milliseconds(v);
    if (env_ulong("VOXMESH_PACE_PER_BYTE_MS", 0, 1000, v))
        s.pacing.per_byte = milliseconds(v);
    if (env_ulong("VOXMESH_PACE_MAX_MS", 0, 60000, v))
        s.pacing.max = milliseconds(v);
    if (env_ulong("VOXMESH_IGNORE_LOOPBACK", 0, 1, v))
        s.ignore_loopback = (v != 0);

    LOG_INFO("[CFG] tier=%s (%zu bytes) quality=%s retries=%d retry_delay=%lldms "
             "rx_timeout=%llds port=%u",
             s.default_tier.c_str(), s.default_budget(), s.default_quality.c_str(), s.retry_count,
             (long long)s.retry_delay.count(), (long long)s.receive_timeout.count(),
             (unsigned)s.app_port);
    return s;
}

}  // namespace config
