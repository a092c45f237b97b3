#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "transport/itransport.hpp"
#include "util/config.hpp"

namespace app
{

enum class SendResult
{
    Ok,
    NothingToSend,   // empty payload; counts as success
    Busy,            // another send holds the guard
    NotConnected,    // link down, or pipeline closed
    BudgetTooSmall,  // wire budget cannot carry MIN_RAW_PER_CHUNK
    TransmitFailed,  // a chunk failed retry_count + 1 times
    Cancelled,       // close() interrupted the send
};

const char *to_string(SendResult r);
inline bool succeeded(SendResult r)
{
    return r == SendResult::Ok || r == SendResult::NothingToSend;
}

enum class SendState
{
    Idle,
    Splitting,
    SendingChunk,
    Waiting,
    Completed,
    Aborted,
};

const char *to_string(SendState s);

// "YYYYMMDD_HHMMSS" in local time
std::string now_timestamp();

// Single-flight outbound path. One send at a time; a concurrent caller gets Busy after the
// configured guard wait instead of queueing.
class SendPipeline
{
  public:
    using Bytes = std::vector<std::uint8_t>;

    SendPipeline(transport::ITransport &tx, config::Settings cfg);

    // split -> per chunk: transmit with bounded retry, then pace
    SendResult send_chunked(const Bytes &data, std::size_t wire_budget);
    // one complete_voice packet
    SendResult send_complete_voice(const Bytes &data, const std::string &timestamp);
    // one test packet
    SendResult send_test(const std::string &text);
    // complete_voice when it fits the tier budget, chunked otherwise
    SendResult send_voice(const Bytes &data, const std::string &tier);

    // Interrupt any retry/pacing wait; later sends report NotConnected until reopen()
    void close();
    void reopen();
    bool closed() const;

    bool        sending() const { return active_.load(); }
    SendState   state() const { return state_.load(); }  // Idle between sends
    // Completed or Aborted for the last guarded send; Idle before the first
    SendState   last_outcome() const { return last_outcome_.load(); }
    std::string last_chunk_id() const;

    std::chrono::milliseconds pacing_delay(std::size_t encoded_size) const;

    const config::Settings &settings() const { return cfg_; }

  private:
    SendResult send_single(const Bytes &wire, const char *what);
    SendResult chunked_locked(const Bytes &data, std::size_t wire_budget);
    SendResult transmit(const Bytes &wire, int attempts, const char *what);
    bool       pause(std::chrono::milliseconds d);  // false when cancelled
    bool       ready() const;

    transport::ITransport &tx_;
    config::Settings       cfg_;

    std::timed_mutex       guard_;
    std::atomic_bool       active_{false};
    std::atomic<SendState> state_{SendState::Idle};
    std::atomic<SendState> last_outcome_{SendState::Idle};

    mutable std::mutex      wait_mu_;
    std::condition_variable wait_cv_;
    bool                    closed_{false};
    std::string             last_chunk_id_;  // guarded by wait_mu_
};

}  // namespace app
