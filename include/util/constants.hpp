#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Mesh broadcast destination alias
inline constexpr std::string_view BROADCAST_ADDR = "^all";

// Private application port for voxmesh envelopes
inline constexpr std::uint16_t DEFAULT_APP_PORT = 256;

// Largest payload one mesh packet carries
inline constexpr std::size_t MAX_MESH_PAYLOAD = 237;

// Length of a generated chunk_id (hex chars)
inline constexpr std::size_t CHUNK_ID_LEN = 8;

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("VOXMESH_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/voxmesh/ctl.sock";
    LOG_SYSTEM("Control socket at %s", sock_path.c_str());
    return sock_path;
}

// Directory for received voice messages
[[maybe_unused]] static std::string inbox_dir()
{
    if (const char *p = std::getenv("VOXMESH_INBOX_DIR"); p && *p)
        return std::string(p);
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/.cache/voxmesh/inbox";
}

}  // namespace constants
