#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Handles one command line; the returned text is written back as the reply line
using LineHandler = std::function<std::string(const std::string &)>;

// Serve one line per connection until a "QUIT" line arrives. Blocks the caller.
bool        start_server(const std::string &sock_path, const LineHandler &on_line);
// Send one line; when reply is non-null, read the server's reply line into it
bool        send_line(const std::string &sock_path, const std::string &line,
                      std::string *reply = nullptr);
std::string expand_user(const std::string &path);

}  // namespace ipc
