#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app/inbox.hpp"
#include "app/reassembly_engine.hpp"
#include "app/send_pipeline.hpp"
#include "transport/itransport.hpp"
#include "util/config.hpp"

namespace app
{

struct Stats
{
    std::uint64_t sent{0};         // messages sent successfully
    std::uint64_t failed{0};       // messages that did not go out
    std::uint64_t chunks_stored{0};
    std::uint64_t duplicates{0};
    std::uint64_t crc_errors{0};
    std::uint64_t out_of_order{0};
    std::uint64_t parse_errors{0};
    std::uint64_t completed{0};    // inbound messages delivered to the inbox
    std::uint64_t reassembly_failed{0};
    std::uint64_t timed_out{0};
    std::uint64_t acks{0};
};

class VoiceService
{
  public:
    using Bytes      = std::vector<std::uint8_t>;
    using OnSendDone = std::function<void(SendResult)>;

    VoiceService(transport::ITransport &t, config::Settings cfg);
    ~VoiceService();

    // Transport role/node id from VOXMESH_TRANSPORT / VOXMESH_NODE_ID
    bool start();
    bool start(const transport::Settings &s);
    void stop();

    // Blocking sends, run on the caller's thread
    SendResult send_voice(const Bytes &compressed, const std::string &tier = "");
    SendResult send_test(const std::string &text);

    // Hand a send to the worker thread; false when a send is already running.
    // `done` runs on the worker and counts as part of the running send.
    bool send_voice_async(Bytes compressed, std::string tier, OnSendDone done = nullptr);

    void on_packet(std::uint16_t port, const Bytes &payload, const std::string &from);

    bool        set_tier(const std::string &tier);
    std::string tier() const;

    Stats                  stats() const;
    std::vector<Abandoned> sweep_now();

    Inbox            &inbox() { return inbox_; }
    ReassemblyEngine &engine() { return engine_; }
    SendPipeline     &pipeline() { return pipeline_; }

  private:
    void sweep_loop();
    void count_send(SendResult r);

    transport::ITransport &tx_;
    config::Settings       cfg_;
    Inbox                  inbox_;
    ReassemblyEngine       engine_;
    SendPipeline           pipeline_;

    mutable std::mutex tier_mu_;
    std::string        tier_;

    mutable std::mutex stats_mu_;
    Stats              stats_{};

    // sweep thread
    std::thread             sweep_thr_;
    std::mutex              sweep_mu_;
    std::condition_variable sweep_cv_;
    bool                    sweep_stop_{true};

    // send worker
    std::thread      send_thr_;
    std::atomic_bool send_busy_{false};
    std::atomic_bool running_{false};
};

}  // namespace app
