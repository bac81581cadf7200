#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <iterator>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool is_number(const std::string &s)
{
    if (s.empty() || s.size() > 10)
        return false;
    for (unsigned char c : s)
    {
        if (!std::isdigit(c))
            return false;
    }
    return std::strtoull(s.c_str(), nullptr, 10) <= 0xFFFFFFFFull;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  wristlinkctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  send <text...>     deliver text to the watch\n"
                         "  send -             read the text from stdin\n"
                         "  abort <msg-id>     cancel an outgoing or incoming message\n"
                         "  tail on|off        log received text\n"
                         "  status\n"
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
    std::string out = line;
    out.push_back('\n');
    if (!ipc::send_line(sock, out))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return exitc::ok;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"send",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string text;
             if (args.size() == 2 && args[1] == "-")
             {
                 text.assign(std::istreambuf_iterator<char>(std::cin),
                             std::istreambuf_iterator<char>());
             }
             else
             {
                 for (size_t i = 1; i < args.size(); ++i)
                 {
                     if (i > 1)
                         text.push_back(' ');
                     text += args[i];
                 }
             }
             return send_line("SEND " + ipc::escape_line(text));
         }},
        {"abort",
         [&]() -> int {
             if (args.size() != 2 || !is_number(args[1]))
             {
                 std::fprintf(stderr, "error: abort expects a message id\n");
                 return exitc::bad_args;
             }
             return send_line("ABORT " + args[1]);
         }},
        {"tail",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string v = to_lower(args[1]);
             if (v != "on" && v != "off")
             {
                 std::fprintf(stderr, "error: tail expects 'on' or 'off'\n");
                 return exitc::bad_args;
             }
             return send_line("TAIL " + v);
         }},
        {"status", [&]() -> int { return send_line("STATUS"); }},
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
    if (const char *lv = std::getenv("WRISTLINK_LOG_LEVEL"))
        wristlink::set_log_level_by_name(lv);

    // env (inside ctl_sock_path), then --sock
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
            sock = ipc::expand_user(argv[++i]);
        else
            args.push_back(std::move(a));
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };
    return run_cmd(args[0], args, sender);
}
