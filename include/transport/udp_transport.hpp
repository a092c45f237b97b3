#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

// Datagram stand-in for the mesh radio, so two daemons can talk over a LAN or localhost.
//
// Datagram: ['V']['M'][ver][flags][port u16 BE][from_len][from][dest_len][dest][payload]
//   flags bit0 = want_ack (informational, UDP has no link-level ack)
inline constexpr std::uint8_t UDP_MAGIC0   = 'V';
inline constexpr std::uint8_t UDP_MAGIC1   = 'M';
inline constexpr std::uint8_t UDP_VER      = 1;
inline constexpr std::uint8_t UDP_WANT_ACK = 1 << 0;

inline constexpr std::size_t UDP_MAX_LEARNED = 256;

struct UdpConfig
{
    std::string              bind_host = "0.0.0.0";
    std::uint16_t            bind_port = 4403;
    std::vector<std::string> peers;  // "host:port"; broadcast goes to every peer
    std::size_t              max_learned = UDP_MAX_LEARNED;  // least recently heard goes first
};

struct UdpDatagram
{
    std::string   from;
    std::string   dest;
    std::uint16_t port{0};
    bool          want_ack{false};
    Bytes         payload;
};

Bytes                      encode_datagram(const UdpDatagram &d);
std::optional<UdpDatagram> decode_datagram(const std::uint8_t *buf, std::size_t len);

// "host:port" -> (host, port); nullopt if malformed
std::optional<std::pair<std::string, std::uint16_t>> split_host_port(const std::string &s);

class UdpTransport final : public ITransport
{
  public:
    explicit UdpTransport(UdpConfig cfg);
    ~UdpTransport() override;

    bool        start(const Settings &s, OnPacket on_rx) override;
    bool        send(const Packet &p) override;
    void        stop() override;
    std::string name() const override { return "udp"; }
    std::string node_id() const override { return settings_.node_id; }
    bool        link_ready() const override;

    // bound port (useful when bind_port == 0)
    std::uint16_t local_port() const;

    // senders with a remembered unicast address
    std::size_t learned_count() const;

  private:
    struct LearnedPeer
    {
        sockaddr_in                           addr{};
        std::chrono::steady_clock::time_point seen{};
    };

    void rx_loop();
    void remember(const std::string &node, const sockaddr_in &addr);
    bool send_to(const Bytes &dgram, const sockaddr_in &addr);

    UdpConfig                cfg_;
    Settings                 settings_{};
    OnPacket                 on_rx_{};
    int                      fd_{-1};
    std::atomic_bool         running_{false};
    std::thread              loop_;
    std::vector<sockaddr_in> peers_;

    mutable std::mutex                 learned_mu_;
    std::map<std::string, LearnedPeer> learned_;  // node id -> last seen address
};

}  // namespace transport
