#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace ipc
{

using LineHandler = std::function<void(const std::string &)>;

// Serve newline-terminated commands on a Unix socket until a "QUIT" line arrives.
// Blocks the calling thread; the socket file is removed on return.
bool start_server(const std::string &sock_path, const LineHandler &on_line);
bool send_line(const std::string &sock_path, const std::string &line);
std::string expand_user(const std::string &path);

// Commands are one line each: text payloads escape '\\', '\n' and '\r'
std::string escape_line(std::string_view text);
std::string unescape_line(std::string_view line);

}  // namespace ipc
