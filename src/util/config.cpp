#include <cstdlib>

#include "proto/frag.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

std::size_t LinkConfig::fragment_bytes() const
{
    const std::size_t room = frame_mtu > frag::HDR_SIZE ? frame_mtu - frag::HDR_SIZE : 0;
    return room < frag::MAX_PAYLOAD ? room : frag::MAX_PAYLOAD;
}

std::optional<Endpoint> parse_endpoint(const std::string &s)
{
    const auto colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= s.size())
        return std::nullopt;

    const std::string port_str = s.substr(colon + 1);
    char             *end      = nullptr;
    unsigned long     port     = std::strtoul(port_str.c_str(), &end, 10);
    if (!end || *end != '\0' || port > 65535)
        return std::nullopt;

    Endpoint ep;
    ep.host = s.substr(0, colon);
    ep.port = static_cast<std::uint16_t>(port);
    return ep;
}

// unsigned value from env within [lo, hi]; false (and a warning) if set but invalid
static bool env_uint(const char *key, unsigned long lo, unsigned long hi, unsigned long &out)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (p && *p == '\0' && v >= lo && v <= hi)
    {
        out = v;
        LOG_INFO("Using %s=%lu", key, v);
        return true;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
    return false;
}

static void env_endpoint(const char *key, Endpoint &out)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return;
    if (auto ep = parse_endpoint(e))
        out = *ep;
    else
        LOG_WARN("Ignoring invalid %s='%s' (expect host:port)", key, e);
}

LinkConfig load_from_env()
{
    LinkConfig cfg;

    if (const char *t = std::getenv("WRISTLINK_TRANSPORT"); t && *t)
    {
        const std::string which(t);
        if (which == "loopback" || which == "udp")
            cfg.transport = which;
        else
            LOG_WARN("Ignoring unknown WRISTLINK_TRANSPORT='%s' (loopback|udp)", t);
    }
    env_endpoint("WRISTLINK_BIND", cfg.bind);
    env_endpoint("WRISTLINK_PEER", cfg.peer);

    unsigned long v = 0;
    if (env_uint("WRISTLINK_FRAME_MTU", frag::HDR_SIZE + frag::MIN_PAYLOAD, 1400, v))
        cfg.frame_mtu = v;
    if (env_uint("WRISTLINK_ACK_TIMEOUT_MS", 50, 60000, v))
        cfg.ack_timeout_ms = static_cast<std::uint32_t>(v);
    if (env_uint("WRISTLINK_MAX_RETRIES", 0, 50, v))
        cfg.max_retries = static_cast<unsigned>(v);
    if (env_uint("WRISTLINK_MAX_MESSAGE_BYTES", 1, 1048576, v))
        cfg.max_message_bytes = v;
    if (env_uint("WRISTLINK_DROP_PCT", 0, 100, v))
        cfg.drop_pct = static_cast<unsigned>(v);

    if (const char *s = std::getenv("WRISTLINK_CTL_SOCK"); s && *s)
        cfg.ctl_sock = s;

    return cfg;
}

}  // namespace config
