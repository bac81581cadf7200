#pragma once
#include <atomic>
#include <cstddef>

#include "transport/itransport.hpp"

namespace transport
{

// Fault injection: silently drops outbound frames with probability drop_pct / 100.
// send() still reports success for a dropped frame, like a radio that lost it in the air.
class LossyTransport final : public ITransport
{
  public:
    LossyTransport(ITransport &inner, unsigned drop_pct);

    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &one_frame) override;
    void        stop() override { inner_.stop(); }
    std::string name() const override { return "lossy+" + inner_.name(); }
    bool        link_ready() const override { return inner_.link_ready(); }

    std::size_t dropped() const { return dropped_.load(); }

  private:
    ITransport              &inner_;
    unsigned                 drop_pct_;
    std::atomic<std::size_t> dropped_{0};
};

}  // namespace transport
