#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake link to run the whole pipeline (ctl -> daemon -> segmenter ->
// reassembler) inside one process.
bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    on_rx_   = std::move(on_rx);
    mtu_     = s.frame_mtu;
    started_ = true;
    return true;
}

bool LoopbackTransport::send(const Frame &one_frame)
{
    if (!started_ || !on_rx_)
        return false;
    if (mtu_ != 0 && one_frame.size() > mtu_)
    {
        LOG_ERROR("loopback: frame of %zu bytes exceeds mtu %zu", one_frame.size(), mtu_);
        return false;
    }
    on_rx_(one_frame);
    return true;
}

void LoopbackTransport::stop()
{
    started_ = false;
    on_rx_   = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    return started_;
}

}  // namespace transport
