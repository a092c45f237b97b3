#pragma once
#include <cstddef>
#include <mutex>

#include "transport/itransport.hpp"

namespace transport
{

// In-process link. Unlinked, a packet is echoed back to the sender; linked, packets go to the
// peer (broadcast or addressed to the peer's node id). Delivery is synchronous.
class LoopbackTransport final : public ITransport
{
  public:
    ~LoopbackTransport() override;

    bool        start(const Settings &s, OnPacket on_rx) override;
    bool        send(const Packet &p) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    std::string node_id() const override;
    bool        link_ready() const override;

    // Pair two loopbacks both ways; either side may be stopped independently
    static void link(LoopbackTransport &a, LoopbackTransport &b);
    void        unlink();

  private:
    OnPacket callback() const;

    mutable std::mutex mu_;
    OnPacket           on_rx_{};
    std::string        node_id_{"!loopback"};
    std::size_t        max_payload_{0};
    bool               started_{false};
    LoopbackTransport *peer_{nullptr};
};

}  // namespace transport
