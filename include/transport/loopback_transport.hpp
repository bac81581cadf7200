#pragma once
#include <cstddef>

#include "transport/itransport.hpp"

namespace transport
{

// Echoes every frame straight back into the local handler, synchronously
class LoopbackTransport final : public ITransport
{
  public:
    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &one_frame) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;

  private:
    OnFrame     on_rx_{};
    std::size_t mtu_{0};
    bool        started_{false};
};

}  // namespace transport
