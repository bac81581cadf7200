#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "util/log.hpp"

namespace constants
{
// Protocol defaults; every one of them can be overridden from the environment (util/config.hpp)
inline constexpr std::size_t   DEFAULT_FRAME_MTU         = 525;  // 13B header + 512B fragment
inline constexpr std::uint32_t DEFAULT_ACK_TIMEOUT_MS    = 1500;
inline constexpr unsigned      DEFAULT_MAX_RETRIES       = 5;
inline constexpr std::size_t   DEFAULT_MAX_MESSAGE_BYTES = 8192;  // watch-side buffer
inline constexpr std::uint32_t TICK_INTERVAL_MS          = 50;

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("WRISTLINK_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/wristlink/ctl.sock";
    LOG_SYSTEM("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
