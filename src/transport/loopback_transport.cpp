#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake mesh to exercise the pipeline (service -> transport -> service)
// without a radio.
LoopbackTransport::~LoopbackTransport()
{
    unlink();
}

bool LoopbackTransport::start(const Settings &s, OnPacket on_rx)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_rx_       = std::move(on_rx);
    max_payload_ = s.max_payload;
    if (!s.node_id.empty())
        node_id_ = s.node_id;
    started_ = true;
    return true;
}

bool LoopbackTransport::send(const Packet &p)
{
    LoopbackTransport *target = nullptr;
    std::string        from;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return false;
        if (max_payload_ != 0 && p.payload.size() > max_payload_)
        {
            LOG_WARN("[LOOP] payload %zu exceeds link limit %zu", p.payload.size(), max_payload_);
            return false;
        }
        target = peer_ ? peer_ : this;
        from   = node_id_;
    }

    if (target != this && p.destination != constants::BROADCAST_ADDR &&
        p.destination != target->node_id())
    {
        LOG_DEBUG("[LOOP] no node %s on this link, packet dropped", p.destination.c_str());
        return true;  // the radio accepted it; nobody heard it
    }

    // invoke outside any lock: the receiver may answer on this same link
    OnPacket cb = target->callback();
    if (!cb)
        return true;
    cb(p.port, p.payload, from);
    return true;
}

void LoopbackTransport::stop()
{
    std::lock_guard<std::mutex> lk(mu_);
    started_ = false;
    on_rx_   = nullptr;
}

std::string LoopbackTransport::node_id() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return node_id_;
}

bool LoopbackTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return started_;
}

void LoopbackTransport::link(LoopbackTransport &a, LoopbackTransport &b)
{
    std::scoped_lock lk(a.mu_, b.mu_);
    a.peer_ = &b;
    b.peer_ = &a;
}

void LoopbackTransport::unlink()
{
    LoopbackTransport *peer = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        peer  = peer_;
        peer_ = nullptr;
    }
    if (peer)
    {
        std::lock_guard<std::mutex> lk(peer->mu_);
        if (peer->peer_ == this)
            peer->peer_ = nullptr;
    }
}

OnPacket LoopbackTransport::callback() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return started_ ? on_rx_ : OnPacket{};
}

}  // namespace transport
