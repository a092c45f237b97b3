#include <atomic>
#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "app/voice_service.hpp"
#include "proto/envelope.hpp"
#include "proto/frag.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"

using namespace std::chrono_literals;

namespace
{

config::Settings fast_settings()
{
    config::Settings s;
    s.retry_delay     = 0ms;
    s.pacing.base     = 0ms;
    s.pacing.per_byte = 0ms;
    s.pacing.max      = 0ms;
    return s;
}

transport::Settings node(const char *id)
{
    transport::Settings s{};
    s.role        = "loopback";
    s.node_id     = id;
    s.max_payload = 237;
    return s;
}

app::VoiceService::Bytes gen_bytes(std::size_t n)
{
    app::VoiceService::Bytes v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 131 + 7) & 0xFF);
    return v;
}

// Two services on a linked loopback pair
struct LinkedPair : ::testing::Test
{
    void SetUp() override
    {
        ASSERT_TRUE(svc_a.start(node("!aaaa0001")));
        ASSERT_TRUE(svc_b.start(node("!bbbb0002")));
        transport::LoopbackTransport::link(tx_a, tx_b);
    }

    transport::LoopbackTransport tx_a, tx_b;
    app::VoiceService            svc_a{tx_a, fast_settings()};
    app::VoiceService            svc_b{tx_b, fast_settings()};
};

}  // namespace

TEST_F(LinkedPair, ChunkedVoiceEndToEnd)
{
    const auto data = gen_bytes(1000);
    ASSERT_EQ(svc_a.send_voice(data), app::SendResult::Ok);

    // Loopback is synchronous; after send_voice the peer has reassembled it
    auto m = svc_b.inbox().try_pop();
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, app::InboundKind::ChunkedVoice);
    EXPECT_EQ(m->from, "!aaaa0001");
    EXPECT_EQ(m->payload, data);
    EXPECT_EQ(m->message_id, svc_a.pipeline().last_chunk_id());

    const auto chunks = frag::split(data, 180);
    ASSERT_TRUE(chunks.has_value());
    const app::Stats sb = svc_b.stats();
    EXPECT_EQ(sb.completed, 1u);
    EXPECT_EQ(sb.chunks_stored, chunks->size());
    EXPECT_EQ(sb.crc_errors, 0u);
    EXPECT_EQ(svc_b.engine().pending(), 0u);

    const app::Stats sa = svc_a.stats();
    EXPECT_EQ(sa.sent, 1u);
    EXPECT_EQ(sa.acks, chunks->size());
}

TEST_F(LinkedPair, SmallVoiceGoesAsOnePacket)
{
    const auto data = gen_bytes(30);
    ASSERT_EQ(svc_a.send_voice(data, "Large"), app::SendResult::Ok);

    auto m = svc_b.inbox().try_pop();
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, app::InboundKind::Voice);
    EXPECT_EQ(m->payload, data);
    EXPECT_EQ(m->text.size(), 15u);  // YYYYMMDD_HHMMSS
    EXPECT_EQ(svc_b.stats().completed, 1u);
    EXPECT_EQ(svc_a.stats().acks, 0u);
}

TEST_F(LinkedPair, TestMessage)
{
    ASSERT_EQ(svc_a.send_test("radio check"), app::SendResult::Ok);
    auto m = svc_b.inbox().try_pop();
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, app::InboundKind::Test);
    EXPECT_EQ(m->text, "radio check");
    EXPECT_EQ(m->from, "!aaaa0001");
}

TEST_F(LinkedPair, ForeignPortAndGarbage)
{
    const std::string text = "type=test|test=x";
    svc_b.on_packet(999, app::VoiceService::Bytes(text.begin(), text.end()), "!cccc0003");
    EXPECT_EQ(svc_b.inbox().size(), 0u);
    EXPECT_EQ(svc_b.stats().parse_errors, 0u);

    const std::string junk = "\x01\x02 not an envelope";
    svc_b.on_packet(256, app::VoiceService::Bytes(junk.begin(), junk.end()), "!cccc0003");
    EXPECT_EQ(svc_b.inbox().size(), 0u);
    EXPECT_EQ(svc_b.stats().parse_errors, 1u);
}

TEST_F(LinkedPair, CorruptCompleteVoiceDropped)
{
    auto env = envelope::make_complete_voice(gen_bytes(20), "20250101_000000");
    env.crc32 ^= 0x10;
    svc_b.on_packet(256, envelope::serialize(env), "!aaaa0001");
    EXPECT_EQ(svc_b.inbox().size(), 0u);
    EXPECT_EQ(svc_b.stats().crc_errors, 1u);
}

TEST_F(LinkedPair, SetTier)
{
    EXPECT_EQ(svc_a.tier(), "Medium");
    EXPECT_TRUE(svc_a.set_tier("Small"));
    EXPECT_EQ(svc_a.tier(), "Small");
    EXPECT_FALSE(svc_a.set_tier("Gigantic"));
    EXPECT_EQ(svc_a.tier(), "Small");

    ASSERT_EQ(svc_a.send_voice(gen_bytes(400)), app::SendResult::Ok);
    const auto chunks = frag::split(gen_bytes(400), 150);
    ASSERT_TRUE(chunks.has_value());
    EXPECT_EQ(svc_a.stats().acks, chunks->size());
}

TEST(VoiceServiceLoopback, OwnPacketsIgnoredByDefault)
{
    transport::LoopbackTransport t;
    app::VoiceService            svc(t, fast_settings());
    ASSERT_TRUE(svc.start(node("!self0001")));

    ASSERT_EQ(svc.send_test("echo?"), app::SendResult::Ok);
    EXPECT_EQ(svc.inbox().size(), 0u);
    svc.stop();
}

TEST(VoiceServiceLoopback, OwnPacketsDeliveredWhenAllowed)
{
    transport::LoopbackTransport t;
    auto                         cfg = fast_settings();
    cfg.ignore_loopback              = false;
    app::VoiceService svc(t, cfg);
    ASSERT_TRUE(svc.start(node("!self0001")));

    ASSERT_EQ(svc.send_test("echo?"), app::SendResult::Ok);
    auto m = svc.inbox().try_pop();
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->text, "echo?");

    const auto data = gen_bytes(700);
    ASSERT_EQ(svc.send_voice(data), app::SendResult::Ok);
    m = svc.inbox().try_pop();
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, app::InboundKind::ChunkedVoice);
    EXPECT_EQ(m->payload, data);
    svc.stop();
}

TEST(VoiceServiceLoopback, SendNotStarted)
{
    transport::LoopbackTransport t;
    app::VoiceService            svc(t, fast_settings());
    EXPECT_EQ(svc.send_test("nobody home"), app::SendResult::NotConnected);
    EXPECT_EQ(svc.stats().failed, 1u);
}

TEST(VoiceServiceLoopback, AsyncSendIsSingleFlight)
{
    transport::LoopbackTransport t;
    auto                         cfg = fast_settings();
    cfg.pacing.base                  = 10s;
    cfg.pacing.max                   = 10s;
    app::VoiceService svc(t, cfg);
    ASSERT_TRUE(svc.start(node("!self0001")));

    std::atomic<int> done{-1};
    ASSERT_TRUE(svc.send_voice_async(gen_bytes(1000), "Medium", [&](app::SendResult r) {
        done.store(static_cast<int>(r));
    }));
    EXPECT_FALSE(svc.send_voice_async(gen_bytes(10), "Medium"));

    for (int i = 0; i < 200 && svc.pipeline().state() != app::SendState::Waiting; ++i)
        std::this_thread::sleep_for(10ms);
    ASSERT_EQ(svc.pipeline().state(), app::SendState::Waiting);

    // stop() wakes the pacing wait and reaps the worker
    svc.stop();
    EXPECT_EQ(done.load(), static_cast<int>(app::SendResult::Cancelled));
    EXPECT_EQ(svc.stats().failed, 1u);
}

TEST(VoiceServiceLoopback, SendFromCompletionCallbackIsRefused)
{
    transport::LoopbackTransport t;
    app::VoiceService            svc(t, fast_settings());
    ASSERT_TRUE(svc.start(node("!self0001")));

    std::atomic<int>  first{-1};
    std::atomic<int>  chained{-1};
    std::atomic<bool> called{false};
    ASSERT_TRUE(svc.send_voice_async(gen_bytes(40), "Medium", [&](app::SendResult r) {
        first.store(static_cast<int>(r));
        // runs on the worker thread while the first send still owns it
        chained.store(svc.send_voice_async(gen_bytes(10), "Medium") ? 1 : 0);
        called.store(true);
    }));

    for (int i = 0; i < 200 && !called.load(); ++i)
        std::this_thread::sleep_for(10ms);
    ASSERT_TRUE(called.load());
    EXPECT_EQ(first.load(), static_cast<int>(app::SendResult::Ok));
    EXPECT_EQ(chained.load(), 0);

    // once the callback has returned the worker accepts the next send
    bool again = false;
    for (int i = 0; i < 200 && !again; ++i)
    {
        again = svc.send_voice_async(gen_bytes(10), "Medium");
        if (!again)
            std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(again);
    for (int i = 0; i < 200 && svc.stats().sent < 2; ++i)
        std::this_thread::sleep_for(10ms);
    EXPECT_EQ(svc.stats().sent, 2u);
    svc.stop();
}

TEST(VoiceServiceLoopback, ReassemblyFailureCounted)
{
    transport::LoopbackTransport t;
    app::VoiceService            svc(t, fast_settings());
    ASSERT_TRUE(svc.start(node("!self0001")));

    // chunk 3 of 2 fills the count while index 2 is still missing
    svc.on_packet(256, envelope::serialize(envelope::make_chunk("7777beef", 1, 2, gen_bytes(8))),
                  "!cccc0003");
    svc.on_packet(256, envelope::serialize(envelope::make_chunk("7777beef", 3, 2, gen_bytes(8))),
                  "!cccc0003");

    const app::Stats st = svc.stats();
    EXPECT_EQ(st.reassembly_failed, 1u);
    EXPECT_EQ(st.completed, 0u);
    EXPECT_EQ(svc.inbox().size(), 0u);
    EXPECT_FALSE(svc.engine().tracking("7777beef"));
    svc.stop();
}

TEST(VoiceServiceLoopback, SweepDropsStalledTransfer)
{
    transport::LoopbackTransport t;
    auto                         cfg = fast_settings();
    cfg.receive_timeout              = 1s;
    app::VoiceService svc(t, cfg);
    ASSERT_TRUE(svc.start(node("!self0001")));

    const auto slice = gen_bytes(20);
    svc.on_packet(256, envelope::serialize(envelope::make_chunk("0badf00d", 1, 3, slice)),
                  "!cccc0003");
    EXPECT_TRUE(svc.engine().tracking("0badf00d"));

    for (int i = 0; i < 60 && svc.stats().timed_out == 0; ++i)
        std::this_thread::sleep_for(50ms);
    EXPECT_EQ(svc.stats().timed_out, 1u);
    EXPECT_FALSE(svc.engine().tracking("0badf00d"));
    EXPECT_EQ(svc.inbox().size(), 0u);
    svc.stop();
}

TEST(VoiceServiceLoopback, RestartClearsState)
{
    transport::LoopbackTransport t;
    app::VoiceService            svc(t, fast_settings());
    ASSERT_TRUE(svc.start(node("!self0001")));
    svc.on_packet(256, envelope::serialize(envelope::make_chunk("11112222", 1, 2, gen_bytes(5))),
                  "!cccc0003");
    EXPECT_EQ(svc.engine().pending(), 1u);

    svc.stop();
    ASSERT_TRUE(svc.start(node("!self0001")));
    EXPECT_EQ(svc.engine().pending(), 0u);
    EXPECT_EQ(svc.send_test("back"), app::SendResult::Ok);
}

TEST(Inbox, ConsumeDrainsMessagesQueuedBeforeClose)
{
    app::Inbox inbox;
    for (const char *text : {"one", "two", "three"})
    {
        app::Inbound m;
        m.text = text;
        inbox.push(std::move(m));
    }
    inbox.close();

    app::Inbound late;
    late.text = "late";
    inbox.push(std::move(late));  // refused once closed

    std::vector<std::string> seen;
    std::thread              writer([&] {
        inbox.consume([&](const app::Inbound &m) { seen.push_back(m.text); }, 10ms);
    });
    writer.join();

    EXPECT_EQ(seen, (std::vector<std::string>{"one", "two", "three"}));
    EXPECT_EQ(inbox.size(), 0u);
}

TEST(Inbox, ConsumeReturnsAfterCloseFromAnotherThread)
{
    app::Inbox        inbox;
    std::atomic<int>  count{0};
    std::atomic<bool> finished{false};
    std::thread       writer([&] {
        inbox.consume([&](const app::Inbound &) { count++; }, 10ms);
        finished.store(true);
    });

    app::Inbound m;
    m.text = "hello";
    inbox.push(m);
    inbox.push(m);
    inbox.close();
    writer.join();

    EXPECT_TRUE(finished.load());
    EXPECT_EQ(count.load(), 2);
}
