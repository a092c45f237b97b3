/* ======================================================================
 * Send Pipeline: state flow
 *
 *  Idle ─▶ Splitting ─▶ SendingChunk(1) ─▶ Waiting(1) ─▶ SendingChunk(2) ...
 *                │              │                │
 *                │              └─ retries spent ┴─ close() ─▶ Aborted
 *                └─ empty / budget error ─▶ Completed / Aborted
 *
 *  SendingChunk(total) ─▶ Completed   (no pacing wait after the last chunk)
 *
 *  The guard (timed mutex + active flag) is held for the whole flight and
 *  released on every exit path. Retry and pacing waits sleep on a condition
 *  variable so close() wakes them immediately.
 * ====================================================================== */

#include <algorithm>
#include <cstdio>
#include <ctime>

#include "app/send_pipeline.hpp"
#include "proto/envelope.hpp"
#include "proto/frag.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{
// Held for the lifetime of one guarded send. On every exit path the final
// state is kept as the last outcome and the pipeline returns to Idle.
class InFlight
{
  public:
    InFlight(std::atomic_bool &active, std::atomic<SendState> &state,
             std::atomic<SendState> &outcome)
        : active_(active), state_(state), outcome_(outcome)
    {
        active_.store(true);
    }
    ~InFlight()
    {
        outcome_.store(state_.exchange(SendState::Idle));
        active_.store(false);
    }

  private:
    std::atomic_bool       &active_;
    std::atomic<SendState> &state_;
    std::atomic<SendState> &outcome_;
};
}  // namespace

const char *to_string(SendResult r)
{
    switch (r)
    {
        case SendResult::Ok:
            return "ok";
        case SendResult::NothingToSend:
            return "nothing_to_send";
        case SendResult::Busy:
            return "busy";
        case SendResult::NotConnected:
            return "not_connected";
        case SendResult::BudgetTooSmall:
            return "budget_too_small";
        case SendResult::TransmitFailed:
            return "transmit_failed";
        case SendResult::Cancelled:
            return "cancelled";
    }
    return "?";
}

const char *to_string(SendState s)
{
    switch (s)
    {
        case SendState::Idle:
            return "idle";
        case SendState::Splitting:
            return "splitting";
        case SendState::SendingChunk:
            return "sending_chunk";
        case SendState::Waiting:
            return "waiting";
        case SendState::Completed:
            return "completed";
        case SendState::Aborted:
            return "aborted";
    }
    return "?";
}

std::string now_timestamp()
{
    std::time_t tt = std::time(nullptr);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm) == 0)
        return "00000000_000000";
    return buf;
}

SendPipeline::SendPipeline(transport::ITransport &tx, config::Settings cfg)
    : tx_(tx), cfg_(std::move(cfg))
{
}

std::chrono::milliseconds SendPipeline::pacing_delay(std::size_t encoded_size) const
{
    const std::chrono::milliseconds d =
        cfg_.pacing.base +
        cfg_.pacing.per_byte * static_cast<std::chrono::milliseconds::rep>(encoded_size);
    return std::min(d, cfg_.pacing.max);
}

bool SendPipeline::ready() const
{
    if (closed())
        return false;
    return tx_.link_ready();
}

bool SendPipeline::pause(std::chrono::milliseconds d)
{
    std::unique_lock<std::mutex> lk(wait_mu_);
    if (d.count() <= 0)
        return !closed_;
    return !wait_cv_.wait_for(lk, d, [this] { return closed_; });
}

// ======================================================================
// Function: SendPipeline::transmit
// - In: serialized envelope, total attempts allowed
// - Out: Ok, TransmitFailed once attempts are spent, Cancelled on close()
// - Note: retry_delay separates attempts; the first attempt goes at once
// ======================================================================
SendResult SendPipeline::transmit(const Bytes &wire, int attempts, const char *what)
{
    transport::Packet p;
    p.payload     = wire;
    p.destination = std::string(constants::BROADCAST_ADDR);
    p.port        = cfg_.app_port;
    p.want_ack    = true;

    for (int attempt = 1; attempt <= attempts; ++attempt)
    {
        if (attempt > 1 && !pause(cfg_.retry_delay))
            return SendResult::Cancelled;
        if (closed())
            return SendResult::Cancelled;
        if (tx_.send(p))
            return SendResult::Ok;
        LOG_WARN("[SEND] %s transmit failed (attempt %d/%d)", what, attempt, attempts);
    }
    return SendResult::TransmitFailed;
}

SendResult SendPipeline::chunked_locked(const Bytes &data, std::size_t wire_budget)
{
    if (!ready())
    {
        state_.store(SendState::Aborted);
        LOG_WARN("[SEND] not connected");
        return SendResult::NotConnected;
    }

    state_.store(SendState::Splitting);
    auto slices = frag::split(data, wire_budget);
    if (!slices)
    {
        state_.store(SendState::Aborted);
        return SendResult::BudgetTooSmall;
    }
    if (slices->empty())
    {
        state_.store(SendState::Completed);
        LOG_INFO("[SEND] nothing to send");
        return SendResult::NothingToSend;
    }

    const std::string id = envelope::generate_chunk_id();
    {
        std::lock_guard<std::mutex> lk(wait_mu_);
        last_chunk_id_ = id;
    }
    const auto total = static_cast<std::uint32_t>(slices->size());
    LOG_INFO("[SEND] %s: %zu bytes in %u chunks (budget %zu)", id.c_str(), data.size(), total,
             wire_budget);

    for (std::uint32_t n = 1; n <= total; ++n)
    {
        state_.store(SendState::SendingChunk);
        const Bytes wire =
            envelope::serialize(envelope::make_chunk(id, n, total, (*slices)[n - 1]));

        char what[32];
        std::snprintf(what, sizeof(what), "chunk %u/%u", n, total);
        const SendResult r = transmit(wire, cfg_.retry_count + 1, what);
        if (r != SendResult::Ok)
        {
            state_.store(SendState::Aborted);
            LOG_ERROR("[SEND] %s aborted at chunk %u/%u: %s", id.c_str(), n, total,
                      to_string(r));
            return r;
        }
        LOG_DEBUG("[SEND] %s %u/%u sent (%zu bytes)", id.c_str(), n, total, wire.size());

        if (n == total)
            break;
        state_.store(SendState::Waiting);
        if (!pause(pacing_delay(wire.size())))
        {
            state_.store(SendState::Aborted);
            LOG_WARN("[SEND] %s cancelled after chunk %u/%u", id.c_str(), n, total);
            return SendResult::Cancelled;
        }
    }

    state_.store(SendState::Completed);
    LOG_INFO("[SEND] %s complete", id.c_str());
    return SendResult::Ok;
}

SendResult SendPipeline::send_chunked(const Bytes &data, std::size_t wire_budget)
{
    std::unique_lock<std::timed_mutex> lk(guard_, std::defer_lock);
    if (!lk.try_lock_for(cfg_.chunked_lock_wait))
    {
        LOG_WARN("[SEND] busy, chunked send refused");
        return SendResult::Busy;
    }
    InFlight flight(active_, state_, last_outcome_);
    return chunked_locked(data, wire_budget);
}

SendResult SendPipeline::send_single(const Bytes &wire, const char *what)
{
    std::unique_lock<std::timed_mutex> lk(guard_, std::defer_lock);
    if (!lk.try_lock_for(cfg_.single_lock_wait))
    {
        LOG_WARN("[SEND] busy, %s refused", what);
        return SendResult::Busy;
    }
    InFlight flight(active_, state_, last_outcome_);

    if (!ready())
    {
        state_.store(SendState::Aborted);
        LOG_WARN("[SEND] not connected");
        return SendResult::NotConnected;
    }
    state_.store(SendState::SendingChunk);
    const SendResult r = transmit(wire, 1, what);
    state_.store(r == SendResult::Ok ? SendState::Completed : SendState::Aborted);
    if (r == SendResult::Ok)
        LOG_INFO("[SEND] %s sent (%zu bytes)", what, wire.size());
    else
        LOG_ERROR("[SEND] %s failed: %s", what, to_string(r));
    return r;
}

SendResult SendPipeline::send_complete_voice(const Bytes &data, const std::string &timestamp)
{
    return send_single(envelope::serialize(envelope::make_complete_voice(data, timestamp)),
                       "complete_voice");
}

SendResult SendPipeline::send_test(const std::string &text)
{
    return send_single(envelope::serialize(envelope::make_test(text)), "test");
}

// ======================================================================
// Function: SendPipeline::send_voice
// - In: compressed audio, tier name (unknown names fall back)
// - Out: result of whichever path was taken
// - Note: one complete_voice packet when it fits the tier budget
// ======================================================================
SendResult SendPipeline::send_voice(const Bytes &data, const std::string &tier)
{
    if (data.empty())
    {
        LOG_INFO("[SEND] nothing to send");
        return SendResult::NothingToSend;
    }
    const std::size_t budget = cfg_.budget_for(tier);
    const Bytes       whole =
        envelope::serialize(envelope::make_complete_voice(data, now_timestamp()));
    if (whole.size() <= budget)
    {
        LOG_DEBUG("[SEND] %zu bytes fit one packet (budget %zu)", whole.size(), budget);
        return send_single(whole, "complete_voice");
    }
    return send_chunked(data, budget);
}

void SendPipeline::close()
{
    {
        std::lock_guard<std::mutex> lk(wait_mu_);
        closed_ = true;
    }
    wait_cv_.notify_all();
    LOG_DEBUG("[SEND] closed");
}

void SendPipeline::reopen()
{
    std::lock_guard<std::mutex> lk(wait_mu_);
    closed_ = false;
}

bool SendPipeline::closed() const
{
    std::lock_guard<std::mutex> lk(wait_mu_);
    return closed_;
}

std::string SendPipeline::last_chunk_id() const
{
    std::lock_guard<std::mutex> lk(wait_mu_);
    return last_chunk_id_;
}

}  // namespace app
