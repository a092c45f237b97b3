#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "app/voice_service.hpp"
#include "audio/zlib_codec.hpp"
#include "ctl/ipc.hpp"
#include "transport/loopback_transport.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

// ---------------- helpers ----------------
static std::vector<std::string> split_list(const std::string &s)
{
    std::vector<std::string> out;
    std::size_t              pos = 0;
    while (pos < s.size())
    {
        std::size_t end = s.find(',', pos);
        if (end == std::string::npos)
            end = s.size();
        if (end > pos)
            out.push_back(s.substr(pos, end - pos));
        pos = end + 1;
    }
    return out;
}

// node ids like "!a1b2c3d4" become file-name safe
static std::string file_safe(const std::string &s)
{
    std::string out;
    for (unsigned char c : s)
        out.push_back(std::isalnum(c) ? static_cast<char>(c) : '_');
    return out.empty() ? std::string("unknown") : out;
}

static unsigned long env_ulong_or(const char *key, unsigned long lo, unsigned long hi,
                                  unsigned long defv)
{
    const char *e = std::getenv(key);
    if (!e)
        return defv;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (*e == '\0' || !p || *p != '\0' || v < lo || v > hi)
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
        return defv;
    }
    return v;
}

std::unique_ptr<transport::ITransport> make_transport_from_env()
{
    const char *t = std::getenv("VOXMESH_TRANSPORT");
    if (t && std::strcmp(t, "udp") == 0)
    {
        transport::UdpConfig cfg;
        if (const char *b = std::getenv("VOXMESH_UDP_BIND"); b && *b)
        {
            if (auto hp = transport::split_host_port(b))
            {
                cfg.bind_host = hp->first;
                cfg.bind_port = hp->second;
            }
            else
            {
                LOG_WARN("Ignoring invalid VOXMESH_UDP_BIND='%s' (expect host:port)", b);
            }
        }
        if (const char *p = std::getenv("VOXMESH_UDP_PEERS"))
            cfg.peers = split_list(p);
        return std::make_unique<transport::UdpTransport>(std::move(cfg));
    }
    // default - loopback
    return std::make_unique<transport::LoopbackTransport>();
}

static audio::AudioFormat pcm_format_from_env()
{
    audio::AudioFormat f;
    f.rate     = static_cast<std::uint32_t>(env_ulong_or("VOXMESH_PCM_RATE", 1, 384000, 8000));
    f.channels = static_cast<std::uint16_t>(env_ulong_or("VOXMESH_PCM_CHANNELS", 1, 32, 1));
    f.sample_width = static_cast<std::uint16_t>(env_ulong_or("VOXMESH_PCM_WIDTH", 1, 4, 2));
    return f;
}

static bool write_file(const fs::path &path, const char *data, std::size_t len)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        LOG_ERROR("[INBOX] cannot open %s: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    out.write(data, static_cast<std::streamsize>(len));
    if (!out)
    {
        LOG_ERROR("[INBOX] short write to %s", path.c_str());
        return false;
    }
    return true;
}

// ======================================================================
// Function: store_inbound
// - In: one delivered message
// - Out: rec_<from>_<ts>.pcm (voice, decompressed) or .txt (test)
// ======================================================================
static void store_inbound(const fs::path &dir, const audio::Codec &codec, const app::Inbound &m)
{
    std::string ts = app::now_timestamp();
    if (m.kind == app::InboundKind::Voice && !m.text.empty())
        ts = file_safe(m.text);
    std::string stem = "rec_" + file_safe(m.from) + "_" + ts;
    if (!m.message_id.empty())
        stem += "_" + file_safe(m.message_id);

    if (m.kind == app::InboundKind::Test)
    {
        const fs::path p = dir / (stem + ".txt");
        if (write_file(p, m.text.data(), m.text.size()))
            LOG_SYSTEM("[INBOX] test from %s: %s", m.from.c_str(), m.text.c_str());
        return;
    }

    auto pcm = codec.decompress(m.payload);
    if (!pcm)
    {
        LOG_WARN("[INBOX] voice from %s could not be decoded, dropped", m.from.c_str());
        return;
    }
    const fs::path p = dir / (stem + ".pcm");
    if (write_file(p, reinterpret_cast<const char *>(pcm->samples.data()), pcm->samples.size()))
        LOG_SYSTEM("[INBOX] voice from %s -> %s (%u Hz, %u ch, %u bytes/sample)",
                   m.from.c_str(), p.c_str(), pcm->format.rate, (unsigned)pcm->format.channels,
                   (unsigned)pcm->format.sample_width);
}

static std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return std::string();
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

static std::string on_line(app::VoiceService       &svc,
                           const config::Settings  &cfg,
                           const audio::Codec      &codec,
                           const audio::AudioFormat &fmt,
                           const std::string       &line)
{
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK bye";
    }
    if (line == "STATS")
    {
        const app::Stats st = svc.stats();
        char             buf[256];
        std::snprintf(buf, sizeof(buf),
                      "OK tier=%s sent=%llu failed=%llu completed=%llu chunks=%llu dup=%llu "
                      "crc=%llu ooo=%llu parse=%llu failed_reassembly=%llu timeout=%llu "
                      "acks=%llu pending=%zu",
                      svc.tier().c_str(), (unsigned long long)st.sent,
                      (unsigned long long)st.failed, (unsigned long long)st.completed,
                      (unsigned long long)st.chunks_stored, (unsigned long long)st.duplicates,
                      (unsigned long long)st.crc_errors, (unsigned long long)st.out_of_order,
                      (unsigned long long)st.parse_errors,
                      (unsigned long long)st.reassembly_failed, (unsigned long long)st.timed_out,
                      (unsigned long long)st.acks, svc.engine().pending());
        return buf;
    }
    if (line.rfind("TIER ", 0) == 0)
    {
        const std::string name = trim(line.substr(5));
        if (!svc.set_tier(name))
            return "ERR unknown tier " + name;
        return "OK tier " + name + " (" + std::to_string(cfg.budget_for(name)) + " bytes)";
    }
    if (line.rfind("TEST ", 0) == 0)
    {
        const std::string text = trim(line.substr(5));
        if (text.empty())
            return "ERR empty test message";
        LOG_INFO("CMD: TEST %s", text.c_str());
        const app::SendResult r = svc.send_test(text);
        if (!app::succeeded(r))
            return std::string("ERR ") + app::to_string(r);
        return "OK test sent";
    }
    if (line.rfind("VOICE ", 0) == 0)
    {
        // VOICE <path> [tier] [quality]; a trailing word is taken only if its table knows it
        std::string path = trim(line.substr(6));
        std::string tier, quality;
        auto        take_last = [&path](const auto &table, std::string &out) {
            auto sp = path.find_last_of(' ');
            if (sp != std::string::npos && table.count(path.substr(sp + 1)))
            {
                out  = path.substr(sp + 1);
                path = trim(path.substr(0, sp));
            }
        };
        take_last(cfg.qualities, quality);
        take_last(cfg.tiers, tier);

        std::ifstream in(path, std::ios::binary);
        if (!in)
            return "ERR cannot read " + path;
        audio::Pcm pcm;
        pcm.format = fmt;
        pcm.samples.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (quality.empty())
            quality = cfg.default_quality;
        auto blob = codec.compress(pcm, cfg.quality_for(quality));
        if (!blob)
            return "ERR compression failed";

        const std::size_t n = blob->size();
        LOG_INFO("CMD: VOICE %s (%zu pcm -> %zu bytes, quality %s)", path.c_str(),
                 pcm.samples.size(), n, quality.c_str());
        bool queued = svc.send_voice_async(std::move(*blob), tier, [path](app::SendResult r) {
            if (app::succeeded(r))
                LOG_SYSTEM("[SEND] %s delivered to the mesh", path.c_str());
            else
                LOG_WARN("[SEND] %s failed: %s", path.c_str(), app::to_string(r));
        });
        if (!queued)
            return "ERR busy";
        return "OK queued " + std::to_string(n) + " bytes";
    }
    LOG_WARN("CMD: unknown '%s'", line.c_str());
    return "ERR unknown command";
}

int main()
{
    voxmesh::init_log_from_env();

    const char *env_transport = std::getenv("VOXMESH_TRANSPORT");
    const char *env_node      = std::getenv("VOXMESH_NODE_ID");
    const char *env_peers     = std::getenv("VOXMESH_UDP_PEERS");
    LOG_SYSTEM("Config: transport=%s node=%s peers=%s",
               env_transport ? env_transport : "loopback", env_node ? env_node : "(auto)",
               env_peers ? env_peers : "(none)");

    const config::Settings   cfg   = config::from_env();
    const audio::AudioFormat fmt   = pcm_format_from_env();
    const audio::ZlibCodec   codec;

    const fs::path  inbox = ipc::expand_user(constants::inbox_dir());
    std::error_code ec;
    fs::create_directories(inbox, ec);
    if (ec)
    {
        LOG_ERROR("create_directories(%s) failed: %s", inbox.c_str(), ec.message().c_str());
        return 1;
    }

    // Bind transport from env var
    auto             tx = make_transport_from_env();
    app::VoiceService svc(*tx, cfg);
    if (!svc.start())
    {
        LOG_ERROR("VoiceService start failed");
        return 1;
    }

    // inbox writer: decompress and store everything the service delivers, including
    // what is still queued when stop() closes the inbox
    std::thread writer([&] {
        svc.inbox().consume([&](const app::Inbound &m) { store_inbound(inbox, codec, m); });
    });

    // IPC server
    const std::string sock = ipc::expand_user(constants::ctl_sock_path());
    const bool        ok   = ipc::start_server(sock, [&](const std::string &line) {
        return on_line(svc, cfg, codec, fmt, line);
    });
    if (!ok)
        LOG_ERROR("start_server failed");

    svc.stop();
    writer.join();
    return ok ? 0 : 1;
}
