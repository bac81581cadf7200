#pragma once
#include <cstdint>
#include <functional>
#include <vector>

namespace frag
{

enum class Reason
{
    Timeout,             // no ACK within the retry budget
    Cancelled,           // abort() by the consumer
    Malformed,           // payload rejected by the receiver (bad UTF-8, too large)
    ChannelUnavailable,  // transport refused the last attempt
};

inline const char *reason_name(Reason r)
{
    switch (r)
    {
        case Reason::Timeout:
            return "timeout";
        case Reason::Cancelled:
            return "cancelled";
        case Reason::Malformed:
            return "malformed";
        case Reason::ChannelUnavailable:
            return "channel-unavailable";
    }
    return "?";
}

// Terminal result of one send()
struct Outcome
{
    std::uint32_t msg_id{0};
    bool          delivered{false};
    Reason        reason{Reason::Timeout};  // meaningful only when !delivered
};

// One bounded frame out to the peer; false when the channel is unavailable
using Transmit = std::function<bool(const std::vector<std::uint8_t> &)>;

}  // namespace frag
