#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

static bool wait_for_socket(const std::string &sock)
{
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path = std::getenv("HOME");
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, EscapeKeepsTextOnOneLine)
{
    const std::string text = "line one\nline two\r\nback\\slash";
    const std::string esc  = ipc::escape_line(text);
    EXPECT_EQ(esc.find('\n'), std::string::npos);
    EXPECT_EQ(esc.find('\r'), std::string::npos);
    EXPECT_EQ(esc, "line one\\nline two\\r\\nback\\\\slash");
    EXPECT_EQ(ipc::unescape_line(esc), text);
}

TEST(IPC, UnescapeLeavesUnknownSequences)
{
    EXPECT_EQ(ipc::unescape_line("tab\\there"), "tab\\there");
    EXPECT_EQ(ipc::unescape_line("trailing\\"), "trailing\\");
    EXPECT_EQ(ipc::unescape_line("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(IPC, TestStartServerAndSendLine)
{
    // temporary socket path
    std::string sock = "/tmp/wristlink-ipc-ut-" + std::to_string(getpid()) + ".sock";

    // run server (blocks until QUIT)
    std::thread th([&] { ipc::start_server(sock, nullptr); });
    ASSERT_TRUE(wait_for_socket(sock));
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\n"));
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, SeveralLinesPerConnection)
{
    std::string              sock = "/tmp/wristlink-ipc-ml-" + std::to_string(getpid()) + ".sock";
    std::vector<std::string> seen;

    std::thread th([&] {
        ipc::start_server(sock, [&](const std::string &line) { seen.push_back(line); });
    });
    ASSERT_TRUE(wait_for_socket(sock));
    ASSERT_TRUE(ipc::send_line(sock, "STATUS\r\n\nTAIL off\n"));
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\nSTATUS\n"));
    th.join();

    // blank lines are skipped, nothing after QUIT is dispatched
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "STATUS");
    EXPECT_EQ(seen[1], "TAIL off");
    EXPECT_EQ(seen[2], "QUIT");
}

TEST(IPC, SendLineFailsWithoutServer)
{
    std::string sock = "/tmp/wristlink-ipc-none-" + std::to_string(getpid()) + ".sock";
    testing::internal::CaptureStderr();
    EXPECT_FALSE(ipc::send_line(sock, "STATUS\n"));
    testing::internal::GetCapturedStderr();
}
