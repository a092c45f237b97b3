/* ======================================================================
 * UDP Transport: overall flow
 *
 *  start(settings, on_rx)
 *    └─ resolve peers, bind socket, spawn rx loop thread
 *
 *  send(packet)
 *    └─ encode datagram [hdr][payload]
 *    └─ dest == "^all"     → sendto every configured peer
 *    └─ dest == node id   → sendto learnt address (else every peer)
 *
 *  rx loop (thread)
 *    └─ poll 100ms → recvfrom → decode → drop if addressed to another node
 *    └─ learn (from → address), deliver via on_rx
 *
 *  stop()
 *    └─ clear running flag, join loop OUTSIDE of any locks, close socket
 * ====================================================================== */

#include <arpa/inet.h>  // htons, ntohs, inet_ntop
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "transport/udp_transport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{
constexpr std::size_t UDP_HDR_MIN = 2 + 1 + 1 + 2 + 1 + 1;  // magic ver flags port from dest
constexpr std::size_t RX_BUF_SIZE = 2048;
constexpr int         POLL_MS     = 100;

std::optional<sockaddr_in> resolve(const std::string &host, std::uint16_t port)
{
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *res     = nullptr;
    int       rc      = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res)
    {
        LOG_ERROR("[UDP] cannot resolve %s: %s", host.c_str(), gai_strerror(rc));
        return std::nullopt;
    }
    sockaddr_in addr{};
    std::memcpy(&addr, res->ai_addr, sizeof(addr));
    addr.sin_port = htons(port);
    freeaddrinfo(res);
    return addr;
}
}  // namespace

Bytes encode_datagram(const UdpDatagram &d)
{
    const std::size_t from_len = d.from.size() > 255 ? 255 : d.from.size();
    const std::size_t dest_len = d.dest.size() > 255 ? 255 : d.dest.size();

    Bytes out;
    out.reserve(UDP_HDR_MIN + from_len + dest_len + d.payload.size());
    out.push_back(UDP_MAGIC0);
    out.push_back(UDP_MAGIC1);
    out.push_back(UDP_VER);
    out.push_back(d.want_ack ? UDP_WANT_ACK : 0);
    out.push_back(static_cast<std::uint8_t>(d.port >> 8));
    out.push_back(static_cast<std::uint8_t>(d.port & 0xFF));
    out.push_back(static_cast<std::uint8_t>(from_len));
    out.insert(out.end(), d.from.begin(), d.from.begin() + from_len);
    out.push_back(static_cast<std::uint8_t>(dest_len));
    out.insert(out.end(), d.dest.begin(), d.dest.begin() + dest_len);
    out.insert(out.end(), d.payload.begin(), d.payload.end());
    return out;
}

std::optional<UdpDatagram> decode_datagram(const std::uint8_t *buf, std::size_t len)
{
    if (len < UDP_HDR_MIN || buf[0] != UDP_MAGIC0 || buf[1] != UDP_MAGIC1 || buf[2] != UDP_VER)
        return std::nullopt;

    UdpDatagram d;
    d.want_ack     = (buf[3] & UDP_WANT_ACK) != 0;
    d.port         = static_cast<std::uint16_t>((buf[4] << 8) | buf[5]);
    std::size_t i  = 6;
    std::size_t fl = buf[i++];
    if (i + fl + 1 > len)
        return std::nullopt;
    d.from.assign(reinterpret_cast<const char *>(buf + i), fl);
    i += fl;
    std::size_t dl = buf[i++];
    if (i + dl > len)
        return std::nullopt;
    d.dest.assign(reinterpret_cast<const char *>(buf + i), dl);
    i += dl;
    d.payload.assign(buf + i, buf + len);
    return d;
}

std::optional<std::pair<std::string, std::uint16_t>> split_host_port(const std::string &s)
{
    const auto colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= s.size())
        return std::nullopt;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s.c_str() + colon + 1, &p, 10);
    if (!p || *p != '\0' || v > 65535)
        return std::nullopt;
    return std::make_pair(s.substr(0, colon), static_cast<std::uint16_t>(v));
}

UdpTransport::UdpTransport(UdpConfig cfg) : cfg_(std::move(cfg)) {}

UdpTransport::~UdpTransport()
{
    stop();
}

// ======================================================================
// Function: UdpTransport::start
// - In: settings with our node id; peers from UdpConfig
// - Out: bound socket and a running rx loop
// ======================================================================
bool UdpTransport::start(const Settings &s, OnPacket on_rx)
{
    if (running_.load(std::memory_order_relaxed))
    {
        LOG_WARN("[UDP] already started");
        return false;
    }
    settings_ = s;
    on_rx_    = std::move(on_rx);
    {
        std::lock_guard<std::mutex> lk(learned_mu_);
        learned_.clear();
    }

    peers_.clear();
    for (const auto &peer : cfg_.peers)
    {
        auto hp = split_host_port(peer);
        if (!hp)
        {
            LOG_ERROR("[UDP] invalid peer '%s' (expect host:port)", peer.c_str());
            return false;
        }
        auto addr = resolve(hp->first, hp->second);
        if (!addr)
            return false;
        peers_.push_back(*addr);
    }

    auto local = resolve(cfg_.bind_host, cfg_.bind_port);
    if (!local)
        return false;

    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd_ == -1)
    {
        LOG_ERROR("[UDP] socket() failed: %s", std::strerror(errno));
        return false;
    }
    int one = 1;
    (void)::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    (void)::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one));

    if (::bind(fd_, reinterpret_cast<const sockaddr *>(&*local), sizeof(*local)) == -1)
    {
        int saved = errno;
        ::close(fd_);
        fd_   = -1;
        errno = saved;
        LOG_ERROR("[UDP] bind(%s:%u) failed: %s", cfg_.bind_host.c_str(),
                  (unsigned)cfg_.bind_port, std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_relaxed);
    loop_ = std::thread([this] { rx_loop(); });
    LOG_INFO("[UDP] node %s listening on %s:%u (%zu peers)", settings_.node_id.c_str(),
             cfg_.bind_host.c_str(), (unsigned)local_port(), peers_.size());
    return true;
}

bool UdpTransport::send(const Packet &p)
{
    if (!running_.load(std::memory_order_relaxed) || fd_ == -1)
        return false;
    if (settings_.max_payload != 0 && p.payload.size() > settings_.max_payload)
    {
        LOG_WARN("[UDP] payload %zu exceeds link limit %zu", p.payload.size(),
                 settings_.max_payload);
        return false;
    }

    UdpDatagram d;
    d.from     = settings_.node_id;
    d.dest     = p.destination;
    d.port     = p.port;
    d.want_ack = p.want_ack;
    d.payload  = p.payload;
    const Bytes dgram = encode_datagram(d);

    if (p.destination != constants::BROADCAST_ADDR)
    {
        std::optional<sockaddr_in> addr;
        {
            std::lock_guard<std::mutex> lk(learned_mu_);
            auto                        it = learned_.find(p.destination);
            if (it != learned_.end())
                addr = it->second.addr;
        }
        if (addr)
            return send_to(dgram, *addr);
        LOG_DEBUG("[UDP] %s not seen yet, flooding to all peers", p.destination.c_str());
    }

    if (peers_.empty())
    {
        LOG_WARN("[UDP] no peers configured");
        return false;
    }
    bool ok = true;
    for (const auto &peer : peers_)
        ok = send_to(dgram, peer) && ok;
    return ok;
}

bool UdpTransport::send_to(const Bytes &dgram, const sockaddr_in &addr)
{
    while (true)
    {
        ssize_t n = ::sendto(fd_, dgram.data(), dgram.size(), MSG_NOSIGNAL,
                             reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
        if (n == static_cast<ssize_t>(dgram.size()))
            return true;
        if (n == -1 && errno == EINTR)
            continue;
        LOG_WARN("[UDP] sendto() failed: %s", n == -1 ? std::strerror(errno) : "short write");
        return false;
    }
}

void UdpTransport::rx_loop()
{
    std::uint8_t buf[RX_BUF_SIZE];
    while (running_.load(std::memory_order_relaxed))
    {
        pollfd pfd{fd_, POLLIN, 0};
        int    pr = ::poll(&pfd, 1, POLL_MS);
        if (pr == 0)
            continue;
        if (pr == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("[UDP] poll() failed: %s", std::strerror(errno));
            break;
        }

        sockaddr_in src{};
        socklen_t   src_len = sizeof(src);
        ssize_t     n =
            ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<sockaddr *>(&src), &src_len);
        if (n <= 0)
            continue;

        auto d = decode_datagram(buf, static_cast<std::size_t>(n));
        if (!d)
        {
            LOG_DEBUG("[UDP] dropping foreign datagram (%zd bytes)", n);
            continue;
        }
        if (d->dest != constants::BROADCAST_ADDR && d->dest != settings_.node_id)
            continue;  // unicast for another node

        if (!d->from.empty())
            remember(d->from, src);
        if (on_rx_)
            on_rx_(d->port, d->payload, d->from);
    }
}

// Remember where `node` was last heard; past max_learned the stalest sender is dropped
void UdpTransport::remember(const std::string &node, const sockaddr_in &addr)
{
    if (cfg_.max_learned == 0)
        return;
    const auto                  now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(learned_mu_);
    if (!learned_.count(node) && learned_.size() >= cfg_.max_learned)
    {
        auto oldest = learned_.begin();
        for (auto i = learned_.begin(); i != learned_.end(); ++i)
            if (i->second.seen < oldest->second.seen)
                oldest = i;
        LOG_DEBUG("[UDP] forgetting %s, %zu senders known", oldest->first.c_str(),
                  learned_.size());
        learned_.erase(oldest);
    }
    learned_[node] = LearnedPeer{addr, now};
}

std::size_t UdpTransport::learned_count() const
{
    std::lock_guard<std::mutex> lk(learned_mu_);
    return learned_.size();
}

// ======================================================================
// Function: UdpTransport::stop
// - Note: joins the rx loop thread before closing the socket
// ======================================================================
void UdpTransport::stop()
{
    if (!running_.exchange(false, std::memory_order_relaxed))
        return;
    if (loop_.joinable())
        loop_.join();
    if (fd_ != -1)
    {
        ::close(fd_);
        fd_ = -1;
    }
    LOG_DEBUG("[UDP] stopped");
}

bool UdpTransport::link_ready() const
{
    return running_.load(std::memory_order_relaxed);
}

std::uint16_t UdpTransport::local_port() const
{
    if (fd_ == -1)
        return 0;
    sockaddr_in addr{};
    socklen_t   len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) == -1)
        return 0;
    return ntohs(addr.sin_port);
}

}  // namespace transport
