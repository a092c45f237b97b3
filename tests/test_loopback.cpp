#include <gtest/gtest.h>
#include <string>

#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"

using namespace transport;

namespace
{
struct Captured
{
    std::uint16_t port{0};
    Bytes         payload;
    std::string   from;
    int           count{0};
};

OnPacket capture_into(Captured &c)
{
    return [&c](std::uint16_t port, const Bytes &payload, const std::string &from) {
        c.port    = port;
        c.payload = payload;
        c.from    = from;
        c.count++;
    };
}

Packet make_packet(Bytes payload, std::string dest = "^all")
{
    Packet p;
    p.payload     = std::move(payload);
    p.destination = std::move(dest);
    p.port        = 256;
    return p;
}
}  // namespace

TEST(Loopback, EchoesPacket)
{
    LoopbackTransport t;
    Captured          captured;

    Settings s{};
    s.role    = "loopback";
    s.node_id = "!self0001";

    ASSERT_TRUE(t.start(s, capture_into(captured)));
    EXPECT_TRUE(t.link_ready());
    EXPECT_EQ(t.node_id(), "!self0001");

    EXPECT_TRUE(t.send(make_packet({1, 2, 3, 4, 5})));
    EXPECT_EQ(captured.count, 1);
    EXPECT_EQ(captured.port, 256);
    EXPECT_EQ(captured.payload, (Bytes{1, 2, 3, 4, 5}));
    EXPECT_EQ(captured.from, "!self0001");

    t.stop();
    EXPECT_FALSE(t.link_ready());
}

TEST(Loopback, SendFailsWhenNotStarted)
{
    LoopbackTransport t;
    EXPECT_FALSE(t.link_ready());
    EXPECT_FALSE(t.send(make_packet({0x42})));
}

TEST(Loopback, RejectsOversizedPayload)
{
    LoopbackTransport t;
    Captured          captured;
    Settings          s{};
    s.max_payload = 4;
    ASSERT_TRUE(t.start(s, capture_into(captured)));

    EXPECT_TRUE(t.send(make_packet({1, 2, 3, 4})));
    EXPECT_FALSE(t.send(make_packet({1, 2, 3, 4, 5})));
    EXPECT_EQ(captured.count, 1);
}

TEST(Loopback, LinkedPairDeliversToPeer)
{
    LoopbackTransport a, b;
    Captured          got_a, got_b;
    Settings          sa{}, sb{};
    sa.node_id = "!aaaa0001";
    sb.node_id = "!bbbb0002";
    ASSERT_TRUE(a.start(sa, capture_into(got_a)));
    ASSERT_TRUE(b.start(sb, capture_into(got_b)));
    LoopbackTransport::link(a, b);

    EXPECT_TRUE(a.send(make_packet({7})));
    EXPECT_EQ(got_b.count, 1);
    EXPECT_EQ(got_b.from, "!aaaa0001");
    EXPECT_EQ(got_a.count, 0);

    // addressed to the peer
    EXPECT_TRUE(b.send(make_packet({8}, "!aaaa0001")));
    EXPECT_EQ(got_a.count, 1);
    EXPECT_EQ(got_a.from, "!bbbb0002");

    // addressed to nobody on the link: accepted, never heard
    EXPECT_TRUE(a.send(make_packet({9}, "!cccc0003")));
    EXPECT_EQ(got_b.count, 1);

    // a stopped peer hears nothing
    b.stop();
    EXPECT_TRUE(a.send(make_packet({10})));
    EXPECT_EQ(got_b.count, 1);

    a.unlink();
    EXPECT_TRUE(a.send(make_packet({11})));
    EXPECT_EQ(got_a.count, 2);  // back to echo
}
