#include <cstdlib>
#include <memory>
#include <string>

#include "app/link_service.hpp"
#include "ctl/ipc.hpp"
#include "transport/loopback_transport.hpp"
#include "transport/lossy_transport.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

static app::LinkService *g_link = nullptr;

static std::unique_ptr<transport::ITransport> make_transport(const config::LinkConfig &cfg)
{
    if (cfg.transport == "udp")
    {
        transport::UdpConfig uc;
        uc.bind = cfg.bind;
        uc.peer = cfg.peer;
        return std::make_unique<transport::UdpTransport>(std::move(uc));
    }
    // default - loopback
    return std::make_unique<transport::LoopbackTransport>();
}

static std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return {};
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

static void on_line(const std::string &line)
{
    if (line == "QUIT")
    {
        LOG_SYSTEM("Received QUIT command, exiting...");
        return;
    }
    if (!g_link)
    {
        LOG_WARN("LinkService not ready");
        return;
    }
    if (line == "TAIL on" || line == "TAIL off")
    {
        const bool on = (line == "TAIL on");
        g_link->set_tail(on);
        LOG_SYSTEM("TAIL %s", on ? "Enabled" : "Disabled");
        return;
    }
    if (line.rfind("SEND ", 0) == 0)
    {
        const std::string text = ipc::unescape_line(line.substr(5));
        if (auto id = g_link->send_text(text))
            LOG_SYSTEM("[QUEUED] msg=%u bytes=%zu", *id, text.size());
        else
            LOG_SYSTEM("[FAIL] SEND refused: text is not valid UTF-8");
        return;
    }
    if (line.rfind("ABORT ", 0) == 0)
    {
        const std::string arg = trim(line.substr(6));
        char             *end = nullptr;
        unsigned long     id  = std::strtoul(arg.c_str(), &end, 10);
        if (arg.empty() || !end || *end != '\0')
        {
            LOG_WARN("CMD: ABORT needs a numeric id (got '%s')", arg.c_str());
            return;
        }
        if (!g_link->abort(static_cast<std::uint32_t>(id)))
            LOG_SYSTEM("[ABORT] msg=%lu not found", id);
        return;
    }
    if (line == "STATUS")
    {
        const app::LinkStatus st = g_link->status();
        LOG_SYSTEM("[STATUS] sending=%s receiving=%s queued=%zu delivered=%zu failed=%zu "
                   "received=%zu",
                   st.sending ? std::to_string(*st.sending).c_str() : "-",
                   st.receiving ? std::to_string(*st.receiving).c_str() : "-", st.queued,
                   st.delivered, st.failed, st.received);
        return;
    }
    LOG_WARN("CMD: unknown command '%s'", line.c_str());
}

int main()
{
    if (const char *log_level = std::getenv("WRISTLINK_LOG_LEVEL"))
        wristlink::set_log_level_by_name(log_level);

    const config::LinkConfig cfg = config::load_from_env();
    LOG_SYSTEM("Config: transport=%s bind=%s:%u peer=%s:%u frame_mtu=%zu drop=%u%%",
               cfg.transport.c_str(), cfg.bind.host.c_str(), (unsigned)cfg.bind.port,
               cfg.peer.host.c_str(), (unsigned)cfg.peer.port, cfg.frame_mtu, cfg.drop_pct);

    auto                                      link_tx = make_transport(cfg);
    std::unique_ptr<transport::LossyTransport> lossy;
    transport::ITransport                    *tx = link_tx.get();
    if (cfg.drop_pct > 0)
    {
        lossy = std::make_unique<transport::LossyTransport>(*link_tx, cfg.drop_pct);
        tx    = lossy.get();
        LOG_WARN("Injecting %u%% frame loss", cfg.drop_pct);
    }

    app::LinkService link(*tx, cfg);
    if (!link.start())
    {
        LOG_ERROR("LinkService start failed");
        return exitc::start_failed;
    }
    g_link = &link;

    std::string sock = cfg.ctl_sock.empty() ? constants::ctl_sock_path() : cfg.ctl_sock;
    sock             = ipc::expand_user(sock);

    const bool ok = ipc::start_server(sock, &on_line);
    g_link        = nullptr;
    link.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return exitc::start_failed;
    }
    return exitc::ok;
}
