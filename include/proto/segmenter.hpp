#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "proto/frag.hpp"
#include "proto/outcome.hpp"
#include "util/constants.hpp"

namespace frag
{

struct SenderConfig
{
    std::size_t   fragment_bytes = MAX_PAYLOAD;
    std::uint32_t ack_timeout_ms = constants::DEFAULT_ACK_TIMEOUT_MS;
    unsigned      max_retries    = constants::DEFAULT_MAX_RETRIES;
};

// Sender side: one message at a time, window = 1, cumulative ACKs.
// Time only moves through tick(), so the owner decides what a millisecond is.
class Segmenter
{
  public:
    using OnOutcome = std::function<void(const Outcome &)>;

    Segmenter(Transmit tx, SenderConfig cfg, std::uint32_t first_msg_id = 1);

    void set_on_outcome(OnOutcome cb) { on_outcome_ = std::move(cb); }

    // Start delivering `text`. Returns the message id, or nullopt when a message is
    // already in flight, the text is not UTF-8 or it cannot be fragmented.
    std::optional<std::uint32_t> send(std::string_view text);

    // Same, with an id picked by the caller; later ids continue from msg_id + 1
    std::optional<std::uint32_t> send(std::uint32_t msg_id, std::string_view text);

    // Cumulative ACK (or REJECT) from the receiver
    void on_ack(const Chunk &ack);

    // Time has passed since the last tick()
    void tick(std::uint64_t ms_since_last_tick);

    // Cancel the active message; false if `msg_id` is not the active one
    bool abort(std::uint32_t msg_id);

    bool                         busy() const { return session_.has_value(); }
    std::optional<std::uint32_t> active_id() const;

    // Accessors for tests
    std::uint16_t next_unacked() const { return session_ ? session_->next_unacked : 0; }
    unsigned      retry_count() const { return session_ ? session_->retry_count : 0; }
    std::size_t   fragments_in_message() const { return session_ ? session_->chunks.size() : 0; }

  private:
    struct Session
    {
        std::uint32_t      msg_id{0};
        std::vector<Chunk> chunks;
        std::uint16_t      next_unacked{0};
        std::int32_t       last_sent{-1};
        unsigned           retry_count{0};
        std::uint64_t      elapsed_ms{0};  // since the current fragment was last sent
        bool               last_tx_failed{false};
    };

    void transmit_current(bool retrans);
    void finish(Outcome out);

    Transmit               tx_;
    SenderConfig           cfg_;
    std::uint32_t          next_id_;
    OnOutcome              on_outcome_{};
    std::optional<Session> session_{};
};

}  // namespace frag
