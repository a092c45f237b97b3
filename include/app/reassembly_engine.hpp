#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/inbox.hpp"
#include "proto/envelope.hpp"
#include "transport/itransport.hpp"

namespace app
{

using Clock = std::chrono::steady_clock;

enum class ChunkStatus
{
    Malformed,         // missing id or zero chunk_num/total_chunks
    CrcError,          // data undecodable or CRC mismatch
    OutOfOrder,        // chunk_num > 1 for an id we have not opened
    Duplicate,         // chunk already stored
    Stored,            // new chunk stored, message still incomplete
    Completed,         // message reassembled and posted to the inbox
    ReassemblyFailed,  // all counted but an index in 1..total missing; state dropped
};

const char *to_string(ChunkStatus s);

// A transfer dropped by sweep_timeouts
struct Abandoned
{
    std::string   chunk_id;
    std::string   from_id;
    std::size_t   received{0};
    std::uint32_t expected{0};
};

class ReassemblyEngine
{
  public:
    ReassemblyEngine(transport::ITransport &tx,
                     Inbox                 &inbox,
                     std::uint16_t          app_port,
                     std::chrono::seconds   receive_timeout);

    ChunkStatus on_chunk_received(const envelope::ChunkEnvelope &env,
                                  const std::string             &from_peer,
                                  Clock::time_point              now = Clock::now());

    // Drop every transfer whose last accepted chunk is older than the receive timeout
    std::vector<Abandoned> sweep_timeouts(Clock::time_point now = Clock::now());

    std::size_t pending() const;
    bool        tracking(const std::string &chunk_id) const;
    std::size_t received_count(const std::string &chunk_id) const;
    void        clear();

    std::chrono::seconds receive_timeout() const { return timeout_; }

  private:
    struct State
    {
        std::uint32_t                                      total{0};
        std::map<std::uint32_t, std::vector<std::uint8_t>> received;
        std::string                                        from_id;
        Clock::time_point                                  last_update{};
    };

    void send_ack(const std::string &chunk_id, std::uint32_t chunk_num, const std::string &to);

    transport::ITransport &tx_;
    Inbox                 &inbox_;
    std::uint16_t          port_;
    std::chrono::seconds   timeout_;

    mutable std::mutex                     mu_;
    std::unordered_map<std::string, State> table_;
};

}  // namespace app
