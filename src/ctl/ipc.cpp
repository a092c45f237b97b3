/* ======================================================================
 * Control socket: one request line, one reply line per connection
 *
 *  voxmeshctl                         voxmeshd (start_server)
 *    connect ───────────────────────▶ accept
 *    "VOICE /tmp/a.pcm Large\n" ─────▶ read_line ─▶ handler(line)
 *    shutdown(SHUT_WR)
 *    read_line ◀───────────────────── "OK queued 812 bytes\n"
 *
 *  "QUIT" is answered like any other line, then the server unlinks the
 *  socket and returns.
 * ====================================================================== */

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <optional>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

namespace
{

struct UnixAddr
{
    sockaddr_un addr{};
    socklen_t   len{0};
};

std::optional<UnixAddr> make_addr(const std::string &sock_path)
{
    UnixAddr a;
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("[IPC] empty socket path");
        return std::nullopt;
    }
    if (sock_path.size() >= sizeof(a.addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("[IPC] path too long for AF_UNIX: %s", sock_path.c_str());
        return std::nullopt;
    }
    a.addr.sun_family = AF_UNIX;
    std::memcpy(a.addr.sun_path, sock_path.c_str(), sock_path.size() + 1);
    a.len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + sock_path.size() + 1);
    return a;
}

void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// close fd without losing the errno that made us give up
void close_keep_errno(int fd)
{
    int saved = errno;
    close(fd);
    errno = saved;
}

bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    const fs::path  dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("[IPC] create_directories(%s) failed: %s", dir.string().c_str(),
                  ec.message().c_str());
        return false;
    }
    // control directory stays private to the user
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("[IPC] permissions(%s, 0700) failed: %s", dir.string().c_str(),
                 ec.message().c_str());
    return true;
}

bool write_all(int fd, const std::string &data)
{
    std::size_t sent = 0;
    while (sent < data.size())
    {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
            sent += static_cast<std::size_t>(n);
        else if (n == -1 && errno == EINTR)
            continue;
        else
            return false;
    }
    return true;
}

// Read up to the first '\n' or EOF; the newline and an optional '\r' are stripped
bool read_line(int fd, std::string &out)
{
    out.clear();
    char buf[256];
    while (out.find('\n') == std::string::npos)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            out.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        return false;
    }
    auto pos = out.find('\n');
    if (pos != std::string::npos)
        out.resize(pos);
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

int open_listener(const std::string &sock_path, const UnixAddr &a)
{
    (void)::unlink(sock_path.c_str());  // stale socket from an earlier run

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("[IPC] socket() failed: %s", std::strerror(errno));
        return -1;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<const sockaddr *>(&a.addr), a.len) == -1)
    {
        close_keep_errno(fd);
        LOG_ERROR("[IPC] bind(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return -1;
    }
    if (listen(fd, 4) == -1)
    {
        close_keep_errno(fd);
        unlink(sock_path.c_str());
        LOG_ERROR("[IPC] listen() failed: %s", std::strerror(errno));
        return -1;
    }
    return fd;
}

}  // namespace

// ======================================================================
// Function: start_server
// - In: socket path, handler producing the reply for each line
// - Out: true after a clean QUIT, false on setup or accept failure
// - Note: a failed read or reply drops that client only
// ======================================================================
bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    auto a = make_addr(sock_path);
    if (!a || !ensure_parent_dir(sock_path))
        return false;

    int fd = open_listener(sock_path, *a);
    if (fd == -1)
        return false;
    LOG_DEBUG("[IPC] listening on %s", sock_path.c_str());

    while (true)
    {
        int client = accept(fd, nullptr, nullptr);
        if (client == -1)
        {
            if (errno == EINTR)
                continue;
            close_keep_errno(fd);
            unlink(sock_path.c_str());
            LOG_ERROR("[IPC] accept() failed: %s", std::strerror(errno));
            return false;
        }
        set_cloexec(client);

        std::string line;
        if (!read_line(client, line))
        {
            close_keep_errno(client);
            LOG_ERROR("[IPC] recv() failed: %s", std::strerror(errno));
            continue;
        }

        std::string reply = on_line ? on_line(line) : std::string("OK");
        reply.push_back('\n');
        if (!write_all(client, reply))  // client may not wait for a reply
            LOG_DEBUG("[IPC] reply to '%s' not delivered: %s", line.c_str(),
                      std::strerror(errno));
        close(client);

        if (line == "QUIT")
            break;
    }

    close(fd);
    unlink(sock_path.c_str());
    return true;
}

bool send_line(const std::string &sock_path, const std::string &line, std::string *reply)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("[IPC] refusing to send an empty line");
        return false;
    }
    auto a = make_addr(sock_path);
    if (!a)
        return false;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("[IPC] socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (connect(fd, reinterpret_cast<const sockaddr *>(&a->addr), a->len) == -1)
    {
        close_keep_errno(fd);
        LOG_ERROR("[IPC] connect(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }

    LOG_DEBUG("[IPC] sending: %s", line.c_str());
    std::string framed = line;
    if (framed.back() != '\n')
        framed.push_back('\n');
    if (!write_all(fd, framed))
    {
        close_keep_errno(fd);
        LOG_ERROR("[IPC] send() failed: %s", std::strerror(errno));
        return false;
    }

    if (reply)
    {
        // half-close so a server reading to EOF sees the end of the request
        (void)shutdown(fd, SHUT_WR);
        if (!read_line(fd, *reply))
        {
            close_keep_errno(fd);
            LOG_ERROR("[IPC] recv() failed: %s", std::strerror(errno));
            return false;
        }
    }

    close(fd);
    return true;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace ipc
