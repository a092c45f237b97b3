#include <utility>

#include "app/reassembly_engine.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

const char *to_string(ChunkStatus s)
{
    switch (s)
    {
        case ChunkStatus::Malformed:
            return "malformed";
        case ChunkStatus::CrcError:
            return "crc_error";
        case ChunkStatus::OutOfOrder:
            return "out_of_order";
        case ChunkStatus::Duplicate:
            return "duplicate";
        case ChunkStatus::Stored:
            return "stored";
        case ChunkStatus::Completed:
            return "completed";
        case ChunkStatus::ReassemblyFailed:
            return "reassembly_failed";
    }
    return "?";
}

ReassemblyEngine::ReassemblyEngine(transport::ITransport &tx,
                                   Inbox                 &inbox,
                                   std::uint16_t          app_port,
                                   std::chrono::seconds   receive_timeout)
    : tx_(tx), inbox_(inbox), port_(app_port), timeout_(receive_timeout)
{
}

void ReassemblyEngine::send_ack(const std::string &chunk_id,
                                std::uint32_t      chunk_num,
                                const std::string &to)
{
    transport::Packet p;
    p.payload     = envelope::serialize(envelope::make_ack(chunk_id, chunk_num));
    p.destination = to.empty() ? std::string(constants::BROADCAST_ADDR) : to;
    p.port        = port_;
    p.want_ack    = false;
    if (!tx_.send(p))
        LOG_WARN("[RECV] ack %s#%u to %s not sent", chunk_id.c_str(), chunk_num,
                 p.destination.c_str());
}

// ======================================================================
// Function: ReassemblyEngine::on_chunk_received
// - In: parsed chunk envelope, sender node id, current time
// - Out: what happened to the chunk
// - Note: only a verified chunk #1 opens a transfer; the table entry is
//         erased before the slices are concatenated
// ======================================================================
ChunkStatus ReassemblyEngine::on_chunk_received(const envelope::ChunkEnvelope &env,
                                                const std::string             &from_peer,
                                                Clock::time_point              now)
{
    if (env.chunk_id.empty() || env.chunk_num == 0 || env.total_chunks == 0)
    {
        LOG_WARN("[RECV] malformed chunk from %s (id='%s' %u/%u)", from_peer.c_str(),
                 env.chunk_id.c_str(), env.chunk_num, env.total_chunks);
        return ChunkStatus::Malformed;
    }

    auto v = envelope::verify_chunk(env);
    if (!v.ok || !v.raw)
    {
        LOG_WARN("[RECV] crc error on %s#%u from %s, dropped", env.chunk_id.c_str(),
                 env.chunk_num, from_peer.c_str());
        return ChunkStatus::CrcError;
    }

    send_ack(env.chunk_id, env.chunk_num, from_peer);

    State done;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = table_.find(env.chunk_id);
        if (it == table_.end())
        {
            if (env.chunk_num != 1)
            {
                LOG_DEBUG("[RECV] %s#%u before #1, dropped", env.chunk_id.c_str(),
                          env.chunk_num);
                return ChunkStatus::OutOfOrder;
            }
            State st;
            st.total   = env.total_chunks;
            st.from_id = from_peer;
            it         = table_.emplace(env.chunk_id, std::move(st)).first;
            LOG_INFO("[RECV] new transfer %s from %s (%u chunks)", env.chunk_id.c_str(),
                     from_peer.c_str(), env.total_chunks);
        }

        State &st = it->second;
        if (st.received.count(env.chunk_num))
        {
            LOG_DEBUG("[RECV] duplicate %s#%u", env.chunk_id.c_str(), env.chunk_num);
            return ChunkStatus::Duplicate;
        }

        st.received.emplace(env.chunk_num, std::move(*v.raw));
        st.last_update = now;
        LOG_DEBUG("[RECV] %s %zu/%u", env.chunk_id.c_str(), st.received.size(), st.total);

        if (st.received.size() < st.total)
            return ChunkStatus::Stored;

        done = std::move(st);
        table_.erase(it);
    }

    if (done.received.size() > done.total)
        LOG_WARN("[RECV] %s over-delivered: %zu chunks for %u", env.chunk_id.c_str(),
                 done.received.size(), done.total);

    Inbound msg;
    msg.kind       = InboundKind::ChunkedVoice;
    msg.from       = done.from_id;
    msg.message_id = env.chunk_id;
    for (std::uint32_t n = 1; n <= done.total; ++n)
    {
        auto part = done.received.find(n);
        if (part == done.received.end())
        {
            LOG_ERROR("[RECV] %s missing chunk %u of %u, transfer dropped",
                      env.chunk_id.c_str(), n, done.total);
            return ChunkStatus::ReassemblyFailed;
        }
        msg.payload.insert(msg.payload.end(), part->second.begin(), part->second.end());
    }

    LOG_INFO("[RECV] %s complete from %s (%zu bytes)", env.chunk_id.c_str(), msg.from.c_str(),
             msg.payload.size());
    inbox_.push(std::move(msg));
    return ChunkStatus::Completed;
}

std::vector<Abandoned> ReassemblyEngine::sweep_timeouts(Clock::time_point now)
{
    std::vector<Abandoned>      out;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = table_.begin(); it != table_.end();)
    {
        if (now - it->second.last_update > timeout_)
        {
            Abandoned a{it->first, it->second.from_id, it->second.received.size(),
                        it->second.total};
            LOG_WARN("[SWEEP] %s from %s timed out with %zu/%u chunks", a.chunk_id.c_str(),
                     a.from_id.c_str(), a.received, a.expected);
            out.push_back(std::move(a));
            it = table_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return out;
}

std::size_t ReassemblyEngine::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return table_.size();
}

bool ReassemblyEngine::tracking(const std::string &chunk_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return table_.count(chunk_id) != 0;
}

std::size_t ReassemblyEngine::received_count(const std::string &chunk_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = table_.find(chunk_id);
    return it == table_.end() ? 0 : it->second.received.size();
}

void ReassemblyEngine::clear()
{
    std::lock_guard<std::mutex> lk(mu_);
    table_.clear();
}

}  // namespace app
