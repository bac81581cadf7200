// tests/test_cli.cpp
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/exitcodes.hpp"

using namespace std::chrono_literals;

namespace test_cli
{
std::mutex               g_mu;
std::vector<std::string> g_lines_to_send;

static void on_line_cb(const std::string &line)
{
    std::lock_guard<std::mutex> lockguard(g_mu);
    g_lines_to_send.push_back(line);
}

static std::string temp_sock_path()
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return base + "/wristlink-cli-test-" + std::to_string(::getpid()) + ".sock";
}

static int run_cli(const std::string &sock, const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd = "./bin/wristlinkctl --sock " + sock + " " + args + " 2>/dev/null";
    int         rc  = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
}  // namespace test_cli

TEST(CLI, TestCliFunctionalality)
{
    test_cli::g_lines_to_send.clear();
    const auto sock = test_cli::temp_sock_path();

    std::atomic<bool> server_done{false};
    std::thread       th([&] {
        (void)ipc::start_server(sock, test_cli::on_line_cb);
        server_done.store(true);
    });

    // Wait for server to bind the socket
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(access(sock.c_str(), F_OK) == 0) << "socket not created: " << sock;

    // Exercise CLI argument parsing + IPC
    EXPECT_EQ(test_cli::run_cli(sock, "send \"hello world!\""), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "send two words"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "send - < /dev/null"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "tail on"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "abort 42"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "status"), exitc::ok);

    // rejected before anything reaches the daemon
    EXPECT_EQ(test_cli::run_cli(sock, "abort next"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "tail maybe"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "send"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "reboot"), exitc::bad_args);

    EXPECT_EQ(test_cli::run_cli(sock, "quit"), exitc::ok);

    th.join();
    ASSERT_TRUE(server_done.load());

    // Validate the lines the daemon saw
    {
        std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
        ASSERT_EQ(test_cli::g_lines_to_send.size(), 7u);
        EXPECT_EQ(test_cli::g_lines_to_send[0], "SEND hello world!");
        EXPECT_EQ(test_cli::g_lines_to_send[1], "SEND two words");
        EXPECT_EQ(test_cli::g_lines_to_send[2], "SEND ");  // empty stdin
        EXPECT_EQ(test_cli::g_lines_to_send[3], "TAIL on");
        EXPECT_EQ(test_cli::g_lines_to_send[4], "ABORT 42");
        EXPECT_EQ(test_cli::g_lines_to_send[5], "STATUS");
        EXPECT_EQ(test_cli::g_lines_to_send.back(), "QUIT");
    }

    // start_server should have cleaned up the socket file
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(CLI, NoServerExitCode)
{
    const auto sock = test_cli::temp_sock_path() + ".absent";
    EXPECT_EQ(test_cli::run_cli(sock, "status"), exitc::no_server);
}

TEST(CLI, MultiLineStdinIsEscaped)
{
    test_cli::g_lines_to_send.clear();
    const auto sock = test_cli::temp_sock_path() + ".stdin";

    std::thread th([&] { (void)ipc::start_server(sock, test_cli::on_line_cb); });
    for (int i = 0; i < 100 && access(sock.c_str(), F_OK) != 0; ++i)
        std::this_thread::sleep_for(10ms);

    EXPECT_EQ(test_cli::run_cli(sock, "send - < " WRISTLINK_SOURCE_DIR "/tests/data/two_lines.txt"),
              exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "quit"), exitc::ok);
    th.join();

    std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
    ASSERT_EQ(test_cli::g_lines_to_send.size(), 2u);
    EXPECT_EQ(test_cli::g_lines_to_send[0], "SEND first line\\nsecond line\\n");
}
