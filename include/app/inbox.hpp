#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace app
{

enum class InboundKind
{
    Voice,         // complete_voice envelope, CRC verified
    ChunkedVoice,  // reassembled from voice_chunk envelopes
    Test           // test envelope
};

struct Inbound
{
    InboundKind               kind{InboundKind::Test};
    std::string               from;
    std::vector<std::uint8_t> payload;  // compressed audio (voice kinds)
    std::string               text;     // test text, or the sender timestamp for Voice
    std::string               message_id;
};

// Handoff from the transport/receive threads to whoever owns application state
class Inbox
{
  public:
    void push(Inbound m)
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return;
            q_.push_back(std::move(m));
        }
        cv_.notify_one();
    }

    // Blocks up to `wait`; nullopt on timeout or once closed and drained
    std::optional<Inbound> pop(std::chrono::milliseconds wait)
    {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, wait, [this] { return closed_ || !q_.empty(); });
        if (q_.empty())
            return std::nullopt;
        Inbound m = std::move(q_.front());
        q_.pop_front();
        return m;
    }

    std::optional<Inbound> try_pop() { return pop(std::chrono::milliseconds(0)); }

    // Hands every message to `fn` until the inbox is closed and empty.
    // push() refuses new messages once closed, so the final drain is complete.
    template <typename Fn>
    void consume(Fn &&fn, std::chrono::milliseconds poll = std::chrono::milliseconds(200))
    {
        while (true)
        {
            if (auto m = pop(poll))
            {
                fn(*m);
                continue;
            }
            if (closed())
                break;
        }
        while (auto m = try_pop())
            fn(*m);
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void reopen()
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = false;
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

  private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Inbound>     q_;
    bool                    closed_{false};
};

}  // namespace app
