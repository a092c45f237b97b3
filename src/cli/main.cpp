#include <cstdio>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  voxmeshctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  voice <file.pcm> [tier] [quality]   send a raw PCM recording\n"
                         "  test <text...>\n"
                         "  tier <name>\n"
                         "  stats\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    std::string reply;
    if (!ipc::send_line(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (!reply.empty())
        std::printf("%s\n", reply.c_str());
    if (reply.rfind("ERR", 0) == 0)
        return exitc::send_failed;
    return exitc::ok;
}

static std::string join_args(const std::vector<std::string> &args, std::size_t from)
{
    std::string text;
    for (size_t i = from; i < args.size(); ++i)
    {
        if (i > from)
            text.push_back(' ');
        text += args[i];
    }
    return text;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"voice",
         [&]() -> int {
             if (args.size() < 2 || args.size() > 4)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::error_code ec;
             auto            path = std::filesystem::absolute(ipc::expand_user(args[1]), ec);
             if (ec || !std::filesystem::is_regular_file(path, ec))
             {
                 std::fprintf(stderr, "error: no such file: %s\n", args[1].c_str());
                 return exitc::bad_args;
             }
             std::string line = "VOICE " + path.string();
             for (std::size_t i = 2; i < args.size(); ++i)
                 line += " " + args[i];
             return send_line(line);
         }},
        {"test",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("TEST " + join_args(args, 1));
         }},
        {"tier",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("TIER " + args[1]);
         }},
        {"stats", [&]() -> int { return send_line("STATS"); }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    voxmesh::init_log_from_env();

    std::vector<std::string> args;
    args.reserve(argc - 1);

    // parse options (only --sock); --sock overrides VOXMESH_CTL_SOCK
    std::string sock;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (sock.empty())
        sock = ipc::expand_user(constants::ctl_sock_path());

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    int rc = run_cmd(cmd, args, sender);
    return rc;
}
