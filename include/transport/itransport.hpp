#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

using Bytes = std::vector<std::uint8_t>;

// One application payload handed to the mesh
struct Packet
{
    Bytes         payload;
    std::string   destination;  // "^all" or a node id such as "!a1b2c3d4"
    std::uint16_t port{0};      // application port number
    bool          want_ack{false};
};

// (application port, payload, sender node id)
using OnPacket = std::function<void(std::uint16_t, const Bytes &, const std::string &)>;

struct Settings
{
    std::string role;             // "loopback" or "udp"
    std::string node_id;          // local node id, stamped as sender on outgoing packets
    std::size_t max_payload = 0;  // largest payload the link accepts, 0 = unlimited
};

struct ITransport
{
    virtual bool        start(const Settings &s, OnPacket on_rx) = 0;
    virtual bool        send(const Packet &p)                    = 0;  // one mesh packet
    virtual void        stop()                                   = 0;
    virtual std::string name() const { return ""; }
    virtual std::string node_id() const = 0;
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
