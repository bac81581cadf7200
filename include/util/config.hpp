#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "util/constants.hpp"

namespace config
{

struct Endpoint
{
    std::string   host;
    std::uint16_t port{0};
};

struct LinkConfig
{
    std::string   transport{"loopback"};  // "loopback" or "udp"
    Endpoint      bind{"0.0.0.0", 47000};
    Endpoint      peer{"127.0.0.1", 47001};
    std::size_t   frame_mtu{constants::DEFAULT_FRAME_MTU};
    std::uint32_t ack_timeout_ms{constants::DEFAULT_ACK_TIMEOUT_MS};
    unsigned      max_retries{constants::DEFAULT_MAX_RETRIES};
    std::size_t   max_message_bytes{constants::DEFAULT_MAX_MESSAGE_BYTES};
    unsigned      drop_pct{0};
    std::string   ctl_sock;

    // min(frame_mtu - HDR_SIZE, MAX_PAYLOAD)
    std::size_t fragment_bytes() const;
};

// "host:port" -> Endpoint, nullopt on a missing colon, empty host or bad port
std::optional<Endpoint> parse_endpoint(const std::string &s);

// Reads WRISTLINK_* variables. Invalid values are logged and the default is kept.
LinkConfig load_from_env();

}  // namespace config
