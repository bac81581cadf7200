#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "proto/outcome.hpp"
#include "proto/reassembler.hpp"
#include "proto/segmenter.hpp"
#include "transport/itransport.hpp"
#include "util/config.hpp"

namespace app
{

struct LinkStatus
{
    std::optional<std::uint32_t> sending;    // active SenderSession
    std::optional<std::uint32_t> receiving;  // active ReceiverBuffer
    std::size_t                  queued{0};
    std::size_t                  delivered{0};
    std::size_t                  failed{0};
    std::size_t                  received{0};
};

// One side of the link: a Segmenter for outgoing text and a Reassembler for incoming
// text over one transport. Every event (RX frame, tick, control call) runs under one
// lock, so both state machines see a single flow of control.
class LinkService
{
  public:
    using OnText    = std::function<void(std::uint32_t msg_id, const std::string &text)>;
    using OnOutcome = std::function<void(const frag::Outcome &)>;
    using OnRxError = std::function<void(std::uint32_t msg_id, frag::Reason reason)>;

    LinkService(transport::ITransport &t, const config::LinkConfig &cfg);
    LinkService(transport::ITransport &t, const config::LinkConfig &cfg, std::uint32_t first_msg_id);
    ~LinkService();

    // Starts the transport; with run_ticker the service also drives its own timers
    bool start(bool run_ticker = true);
    void stop();

    // Queue `text`; returns the message id it will be sent as, nullopt if not UTF-8
    std::optional<std::uint32_t> send_text(std::string_view text);

    // Cancel an active or queued outgoing message, or the incoming one with that id
    bool abort(std::uint32_t msg_id);

    // Advance protocol time by hand (tests, or callers that own the clock)
    void tick(std::uint64_t ms);

    void on_rx(const transport::Frame &f);

    void set_on_text(OnText cb);
    void set_on_outcome(OnOutcome cb);
    void set_on_rx_error(OnRxError cb);
    void set_tail(bool on) { tail_enabled_.store(on, std::memory_order_relaxed); }

    LinkStatus status() const;

  private:
    struct Pending
    {
        std::uint32_t msg_id;
        std::string   text;
    };

    bool transmit(const std::vector<std::uint8_t> &frame);
    void handle_outcome(const frag::Outcome &out);
    void pump_queue();

    transport::ITransport     &tx_;
    config::LinkConfig         cfg_;
    frag::Segmenter            seg_;
    frag::Reassembler          rx_;
    std::uint32_t              next_id_;
    std::deque<Pending>        queue_;
    mutable std::recursive_mutex mu_;  // a synchronous transport re-enters on_rx from send

    OnText    on_text_{};
    OnOutcome on_outcome_{};
    OnRxError on_rx_error_{};

    std::atomic<bool> tail_enabled_{true};
    std::size_t       delivered_{0};
    std::size_t       failed_{0};
    std::size_t       received_{0};

    std::thread      tick_thr_;
    std::atomic_bool tick_stop_{true};
};

}  // namespace app
