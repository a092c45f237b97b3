#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

#include "app/voice_service.hpp"
#include "proto/envelope.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

VoiceService::VoiceService(transport::ITransport &t, config::Settings cfg)
    : tx_(t),
      cfg_(std::move(cfg)),
      engine_(t, inbox_, cfg_.app_port, cfg_.receive_timeout),
      pipeline_(t, cfg_),
      tier_(cfg_.default_tier)
{
}

VoiceService::~VoiceService()
{
    stop();
}

bool VoiceService::start()
{
    // Default to loopback
    auto env_or = [](const char *key, const char *defv) -> std::string {
        const char *v = std::getenv(key);
        return v && *v ? std::string(v) : std::string(defv);
    };

    transport::Settings s{};
    s.role        = env_or("VOXMESH_TRANSPORT", "loopback");
    s.node_id     = env_or("VOXMESH_NODE_ID", "");
    s.max_payload = constants::MAX_MESH_PAYLOAD;
    // a radio link needs an address others can reply to
    if (s.node_id.empty() && s.role != "loopback")
        s.node_id = "!" + envelope::generate_chunk_id();
    return start(s);
}

bool VoiceService::start(const transport::Settings &s)
{
    // in case a previous run is still around
    stop();

    pipeline_.reopen();
    inbox_.reopen();
    engine_.clear();

    bool ok = tx_.start(s, [this](std::uint16_t port, const Bytes &payload,
                                  const std::string &from) { on_packet(port, payload, from); });
    if (!ok)
    {
        LOG_ERROR("start: %s transport failed to start", tx_.name().c_str());
        return false;
    }
    running_.store(true);

    {
        std::lock_guard<std::mutex> lk(sweep_mu_);
        sweep_stop_ = false;
    }
    sweep_thr_ = std::thread([this] { sweep_loop(); });

    LOG_INFO("start: node %s on %s, port %u, tier %s", tx_.node_id().c_str(),
             tx_.name().c_str(), (unsigned)cfg_.app_port, tier().c_str());
    return true;
}

// ======================================================================
// Function: VoiceService::stop
// - Note: close() first so an in-flight send wakes from its wait, then
//         join worker threads outside of any locks, then stop the link
// ======================================================================
void VoiceService::stop()
{
    pipeline_.close();
    inbox_.close();
    {
        std::lock_guard<std::mutex> lk(sweep_mu_);
        sweep_stop_ = true;
    }
    sweep_cv_.notify_all();
    if (sweep_thr_.joinable())
        sweep_thr_.join();
    if (send_thr_.joinable())
        send_thr_.join();

    if (running_.exchange(false))
    {
        tx_.stop();
        LOG_INFO("stop: service stopped");
    }
}

void VoiceService::count_send(SendResult r)
{
    std::lock_guard<std::mutex> lk(stats_mu_);
    if (r == SendResult::Ok)
        stats_.sent++;
    else if (!succeeded(r))
        stats_.failed++;
}

SendResult VoiceService::send_voice(const Bytes &compressed, const std::string &tier_name)
{
    const std::string t = tier_name.empty() ? tier() : tier_name;
    SendResult        r = pipeline_.send_voice(compressed, t);
    count_send(r);
    return r;
}

SendResult VoiceService::send_test(const std::string &text)
{
    SendResult r = pipeline_.send_test(text);
    count_send(r);
    return r;
}

bool VoiceService::send_voice_async(Bytes compressed, std::string tier_name, OnSendDone done)
{
    if (send_busy_.exchange(true))
    {
        LOG_WARN("[SEND] a send is already running");
        return false;
    }
    // previous worker has finished its send; reap it
    if (send_thr_.joinable())
        send_thr_.join();

    send_thr_ = std::thread([this, data = std::move(compressed), t = std::move(tier_name),
                             cb = std::move(done)] {
        SendResult r = send_voice(data, t);
        // the callback is part of this send; a send requested from it gets false
        if (cb)
            cb(r);
        send_busy_.store(false);
    });
    return true;
}

// ======================================================================
// Function: VoiceService::on_packet
// - In: packet from the transport rx path
// - Note: runs on the transport's thread; results leave only via the inbox
// ======================================================================
void VoiceService::on_packet(std::uint16_t port, const Bytes &payload, const std::string &from)
{
    if (port != cfg_.app_port)
    {
        LOG_DEBUG("[RECV] ignoring port %u from %s", (unsigned)port, from.c_str());
        return;
    }
    if (cfg_.ignore_loopback && !from.empty() && from == tx_.node_id())
    {
        LOG_DEBUG("[RECV] ignoring own packet");
        return;
    }

    auto env = envelope::parse(payload);
    if (!env)
    {
        std::lock_guard<std::mutex> lk(stats_mu_);
        stats_.parse_errors++;
        return;
    }

    std::visit(envelope::overloaded{
                   [&](const envelope::ChunkEnvelope &c) {
                       const ChunkStatus st = engine_.on_chunk_received(c, from);
                       std::lock_guard<std::mutex> lk(stats_mu_);
                       switch (st)
                       {
                           case ChunkStatus::Stored:
                               stats_.chunks_stored++;
                               break;
                           case ChunkStatus::Completed:
                               stats_.chunks_stored++;
                               stats_.completed++;
                               break;
                           case ChunkStatus::Duplicate:
                               stats_.duplicates++;
                               break;
                           case ChunkStatus::CrcError:
                               stats_.crc_errors++;
                               break;
                           case ChunkStatus::OutOfOrder:
                               stats_.out_of_order++;
                               break;
                           case ChunkStatus::Malformed:
                               stats_.parse_errors++;
                               break;
                           case ChunkStatus::ReassemblyFailed:
                               stats_.chunks_stored++;
                               stats_.reassembly_failed++;
                               break;
                       }
                   },
                   [&](const envelope::AckEnvelope &a) {
                       LOG_INFO("[RECV] ack %s#%u from %s", a.ack_id.c_str(), a.chunk_num,
                                from.c_str());
                       std::lock_guard<std::mutex> lk(stats_mu_);
                       stats_.acks++;
                   },
                   [&](const envelope::TestEnvelope &t) {
                       LOG_INFO("[RECV] test from %s: %s", from.c_str(), t.test.c_str());
                       Inbound m;
                       m.kind = InboundKind::Test;
                       m.from = from;
                       m.text = t.test;
                       inbox_.push(std::move(m));
                   },
                   [&](const envelope::CompleteVoiceEnvelope &v) {
                       auto checked = envelope::verify_complete(v);
                       if (!checked.ok || !checked.raw)
                       {
                           LOG_WARN("[RECV] complete_voice from %s failed crc, dropped",
                                    from.c_str());
                           std::lock_guard<std::mutex> lk(stats_mu_);
                           stats_.crc_errors++;
                           return;
                       }
                       LOG_INFO("[RECV] voice from %s (%zu bytes, %s)", from.c_str(),
                                checked.raw->size(), v.timestamp.c_str());
                       Inbound m;
                       m.kind    = InboundKind::Voice;
                       m.from    = from;
                       m.payload = std::move(*checked.raw);
                       m.text    = v.timestamp;
                       inbox_.push(std::move(m));
                       std::lock_guard<std::mutex> lk(stats_mu_);
                       stats_.completed++;
                   },
               },
               *env);
}

bool VoiceService::set_tier(const std::string &tier_name)
{
    if (!cfg_.tiers.count(tier_name))
    {
        LOG_WARN("set_tier: unknown tier '%s'", tier_name.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lk(tier_mu_);
    tier_ = tier_name;
    LOG_INFO("set_tier: %s (%zu bytes)", tier_name.c_str(), cfg_.budget_for(tier_name));
    return true;
}

std::string VoiceService::tier() const
{
    std::lock_guard<std::mutex> lk(tier_mu_);
    return tier_;
}

Stats VoiceService::stats() const
{
    std::lock_guard<std::mutex> lk(stats_mu_);
    return stats_;
}

std::vector<Abandoned> VoiceService::sweep_now()
{
    auto dropped = engine_.sweep_timeouts();
    if (!dropped.empty())
    {
        std::lock_guard<std::mutex> lk(stats_mu_);
        stats_.timed_out += dropped.size();
    }
    return dropped;
}

void VoiceService::sweep_loop()
{
    using std::chrono::milliseconds;
    const milliseconds interval =
        std::max(std::chrono::duration_cast<milliseconds>(cfg_.receive_timeout) / 2,
                 milliseconds(100));

    std::unique_lock<std::mutex> lk(sweep_mu_);
    while (!sweep_stop_)
    {
        if (sweep_cv_.wait_for(lk, interval, [this] { return sweep_stop_; }))
            break;
        lk.unlock();
        sweep_now();
        lk.lock();
    }
}

}  // namespace app
