#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "proto/frag.hpp"
#include "proto/outcome.hpp"
#include "util/constants.hpp"

namespace frag
{

// Receiver side: accepts fragments strictly in order, one message at a time, and
// answers every DATA fragment with a cumulative ACK.
class Reassembler
{
  public:
    using OnComplete = std::function<void(std::uint32_t msg_id, const std::string &text)>;
    using OnError    = std::function<void(std::uint32_t msg_id, Reason reason)>;

    explicit Reassembler(Transmit    tx,
                         std::size_t max_message_bytes = constants::DEFAULT_MAX_MESSAGE_BYTES);

    void set_on_complete(OnComplete cb) { on_complete_ = std::move(cb); }
    void set_on_error(OnError cb) { on_error_ = std::move(cb); }

    // Feed one DATA chunk (already parsed); ACKs go out through tx
    void on_fragment(const Chunk &c);

    // Drop the in-flight buffer, if any, without reporting
    void reset();

    // Drop the in-flight buffer for `msg_id` and report Cancelled
    bool abort(std::uint32_t msg_id);

    std::optional<std::uint32_t> in_flight() const;
    std::size_t                  buffered_bytes() const { return buf_ ? buf_->data.size() : 0; }
    std::uint16_t                expected_index() const { return buf_ ? buf_->expected : 0; }

  private:
    struct Buffer
    {
        std::uint32_t msg_id{0};
        std::uint16_t total{0};
        std::uint16_t expected{0};  // next contiguous index
        std::string   data;
    };

    // Last finished message, to answer retransmits after a lost final ACK
    struct Finished
    {
        std::uint32_t msg_id{0};
        std::uint16_t final_seq{0};
        std::uint16_t total{0};
        bool          rejected{false};
        bool          cancelled{false};
    };

    void ack(std::uint32_t msg_id, std::uint16_t seq, std::uint16_t total, bool refuse = false);
    void finalize();
    void reject(Reason why);

    Transmit                tx_;
    std::size_t             max_message_bytes_;
    OnComplete              on_complete_{};
    OnError                 on_error_{};
    std::optional<Buffer>   buf_{};
    std::optional<Finished> last_{};
};

}  // namespace frag
