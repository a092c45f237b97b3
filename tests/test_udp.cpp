#include <arpa/inet.h>
#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

#include "transport/udp_transport.hpp"
#include "util/log.hpp"

using namespace transport;
using namespace std::chrono_literals;

TEST(Udp, DatagramEncodeDecode)
{
    UdpDatagram d;
    d.from     = "!aaaa0001";
    d.dest     = "^all";
    d.port     = 256;
    d.want_ack = true;
    d.payload  = {'h', 'i'};

    const Bytes wire = encode_datagram(d);
    ASSERT_GE(wire.size(), 8u);
    EXPECT_EQ(wire[0], 'V');
    EXPECT_EQ(wire[1], 'M');
    EXPECT_EQ(wire[4], 0x01);  // port, big endian
    EXPECT_EQ(wire[5], 0x00);

    auto back = decode_datagram(wire.data(), wire.size());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->from, d.from);
    EXPECT_EQ(back->dest, d.dest);
    EXPECT_EQ(back->port, d.port);
    EXPECT_TRUE(back->want_ack);
    EXPECT_EQ(back->payload, d.payload);
}

TEST(Udp, DatagramRejectsForeign)
{
    UdpDatagram d;
    d.from = "!aaaa0001";
    d.dest = "!bbbb0002";
    Bytes wire = encode_datagram(d);

    EXPECT_FALSE(decode_datagram(wire.data(), 5).has_value());
    EXPECT_FALSE(decode_datagram(wire.data(), 12).has_value());  // from cut short

    Bytes bad_magic = wire;
    bad_magic[0]    = 'X';
    EXPECT_FALSE(decode_datagram(bad_magic.data(), bad_magic.size()).has_value());

    Bytes bad_ver = wire;
    bad_ver[2]    = 9;
    EXPECT_FALSE(decode_datagram(bad_ver.data(), bad_ver.size()).has_value());
}

TEST(Udp, SplitHostPort)
{
    auto hp = split_host_port("127.0.0.1:4403");
    ASSERT_TRUE(hp.has_value());
    EXPECT_EQ(hp->first, "127.0.0.1");
    EXPECT_EQ(hp->second, 4403);

    EXPECT_FALSE(split_host_port("127.0.0.1").has_value());
    EXPECT_FALSE(split_host_port(":4403").has_value());
    EXPECT_FALSE(split_host_port("host:").has_value());
    EXPECT_FALSE(split_host_port("host:70000").has_value());
    EXPECT_FALSE(split_host_port("host:44x").has_value());
}

namespace
{
struct Mailbox
{
    std::mutex              mu;
    std::condition_variable cv;
    std::uint16_t           port{0};
    Bytes                   payload;
    std::string             from;
    int                     count{0};

    OnPacket callback()
    {
        return [this](std::uint16_t p, const Bytes &data, const std::string &sender) {
            std::lock_guard<std::mutex> lk(mu);
            port    = p;
            payload = data;
            from    = sender;
            count++;
            cv.notify_all();
        };
    }

    bool wait_for_count(int n)
    {
        std::unique_lock<std::mutex> lk(mu);
        return cv.wait_for(lk, 2s, [&] { return count >= n; });
    }
};
}  // namespace

TEST(Udp, BroadcastThenLearntUnicast)
{
    Mailbox  box_a, box_b;
    Settings sa{}, sb{};
    sa.role    = "udp";
    sa.node_id = "!aaaa0001";
    sb.role    = "udp";
    sb.node_id = "!bbbb0002";

    UdpConfig cb;
    cb.bind_host = "127.0.0.1";
    cb.bind_port = 0;
    UdpTransport b(cb);
    ASSERT_TRUE(b.start(sb, box_b.callback()));
    ASSERT_NE(b.local_port(), 0);

    UdpConfig ca;
    ca.bind_host = "127.0.0.1";
    ca.bind_port = 0;
    ca.peers     = {"127.0.0.1:" + std::to_string(b.local_port())};
    UdpTransport a(ca);
    ASSERT_TRUE(a.start(sa, box_a.callback()));
    EXPECT_TRUE(a.link_ready());

    Packet p;
    p.payload     = {'p', 'i', 'n', 'g'};
    p.destination = "^all";
    p.port        = 256;
    ASSERT_TRUE(a.send(p));
    ASSERT_TRUE(box_b.wait_for_count(1));
    {
        std::lock_guard<std::mutex> lk(box_b.mu);
        EXPECT_EQ(box_b.from, "!aaaa0001");
        EXPECT_EQ(box_b.port, 256);
        EXPECT_EQ(box_b.payload, p.payload);
    }

    // b has no peers of its own; the reply goes to the address it learnt for a
    Packet reply;
    reply.payload     = {'p', 'o', 'n', 'g'};
    reply.destination = "!aaaa0001";
    reply.port        = 256;
    ASSERT_TRUE(b.send(reply));
    ASSERT_TRUE(box_a.wait_for_count(1));
    {
        std::lock_guard<std::mutex> lk(box_a.mu);
        EXPECT_EQ(box_a.from, "!bbbb0002");
        EXPECT_EQ(box_a.payload, reply.payload);
    }

    // unknown destination with no peers configured
    Packet lost = reply;
    lost.destination = "!cccc0003";
    EXPECT_FALSE(b.send(lost));

    a.stop();
    b.stop();
    EXPECT_FALSE(a.link_ready());
    EXPECT_FALSE(a.send(p));
}

TEST(Udp, LearntSendersAreCapped)
{
    Mailbox  box;
    Settings sb{};
    sb.role    = "udp";
    sb.node_id = "!bbbb0002";

    UdpConfig cb;
    cb.bind_host   = "127.0.0.1";
    cb.bind_port   = 0;
    cb.max_learned = 4;
    UdpTransport b(cb);
    ASSERT_TRUE(b.start(sb, box.callback()));

    // one plain socket posing as ten different senders
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_NE(fd, -1);
    sockaddr_in to{};
    to.sin_family      = AF_INET;
    to.sin_port        = htons(b.local_port());
    to.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    for (int i = 0; i < 10; ++i)
    {
        UdpDatagram d;
        d.from    = "!n" + std::to_string(i);
        d.dest    = "^all";
        d.port    = 256;
        d.payload = {'x'};
        const Bytes wire = encode_datagram(d);
        ASSERT_EQ(::sendto(fd, wire.data(), wire.size(), 0, reinterpret_cast<sockaddr *>(&to),
                           sizeof(to)),
                  static_cast<ssize_t>(wire.size()));
        // one at a time, so arrival order is send order
        ASSERT_TRUE(box.wait_for_count(i + 1));
    }
    EXPECT_EQ(b.learned_count(), 4u);

    Packet p;
    p.payload     = {'o', 'k'};
    p.port        = 256;
    p.destination = "!n9";
    EXPECT_TRUE(b.send(p));
    p.destination = "!n0";  // forgotten, and b has no peers to flood to
    EXPECT_FALSE(b.send(p));

    ::close(fd);
    b.stop();
}

TEST(Udp, RejectsInvalidPeer)
{
    UdpConfig cfg;
    cfg.bind_host = "127.0.0.1";
    cfg.bind_port = 0;
    cfg.peers     = {"no-port-here"};
    UdpTransport t(cfg);
    Settings     s{};
    EXPECT_FALSE(t.start(s, nullptr));
    EXPECT_FALSE(t.link_ready());
}
