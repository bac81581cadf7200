#include <sodium.h>

#include "transport/lossy_transport.hpp"
#include "util/log.hpp"

namespace transport
{

LossyTransport::LossyTransport(ITransport &inner, unsigned drop_pct)
    : inner_(inner), drop_pct_(drop_pct > 100 ? 100 : drop_pct)
{
}

bool LossyTransport::start(const Settings &s, OnFrame on_rx)
{
    if (sodium_init() < 0)
    {
        LOG_ERROR("sodium_init failed");
        return false;
    }
    return inner_.start(s, std::move(on_rx));
}

bool LossyTransport::send(const Frame &one_frame)
{
    if (drop_pct_ > 0 && randombytes_uniform(100) < drop_pct_)
    {
        dropped_.fetch_add(1);
        LOG_SYSTEM("[DROP] frame of %zu bytes (injected loss %u%%)", one_frame.size(), drop_pct_);
        return true;
    }
    return inner_.send(one_frame);
}

}  // namespace transport
