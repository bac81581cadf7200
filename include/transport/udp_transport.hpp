#pragma once
#include <atomic>
#include <mutex>
#include <netinet/in.h>
#include <thread>

#include "transport/itransport.hpp"
#include "util/config.hpp"

namespace transport
{

struct UdpConfig
{
    config::Endpoint bind{"0.0.0.0", 47000};
    config::Endpoint peer{"127.0.0.1", 47001};
};

// One datagram per frame. Inbound datagrams are read on a private thread and handed to
// the OnFrame handler from there.
class UdpTransport final : public ITransport
{
  public:
    explicit UdpTransport(UdpConfig cfg);
    ~UdpTransport() override;

    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &one_frame) override;
    void        stop() override;
    std::string name() const override { return "udp"; }
    bool        link_ready() const override;

    // Port actually bound (useful when bind.port == 0)
    std::uint16_t local_port() const { return local_port_; }

  private:
    void rx_loop();

    UdpConfig          cfg_;
    Settings           settings_{};
    OnFrame            on_rx_{};
    mutable std::mutex fd_mu_;  // guards fd_ against a concurrent stop()
    int                fd_{-1};
    sockaddr_in        peer_addr_{};
    std::uint16_t      local_port_{0};
    std::atomic_bool   running_{false};
    std::thread        rx_thr_;
};

}  // namespace transport
