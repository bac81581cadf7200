#include "proto/reassembler.hpp"
#include "proto/utf8.hpp"
#include "util/log.hpp"

namespace frag
{

// How far behind a known id a fragment may be and still count as a late copy of an
// earlier message. Anything further back is a sender that restarted with a new id seed.
static constexpr std::uint32_t STALE_ID_WINDOW = 1024;

// true if `id` comes shortly before `ref`, modulo 2^32
static bool recently_before(std::uint32_t id, std::uint32_t ref)
{
    const std::uint32_t behind = ref - id;
    return behind != 0 && behind <= STALE_ID_WINDOW;
}

Reassembler::Reassembler(Transmit tx, std::size_t max_message_bytes)
    : tx_(std::move(tx)), max_message_bytes_(max_message_bytes)
{
}

std::optional<std::uint32_t> Reassembler::in_flight() const
{
    if (!buf_)
        return std::nullopt;
    return buf_->msg_id;
}

void Reassembler::on_fragment(const Chunk &c)
{
    // make sure this is a valid chunk
    if (!c.is_data() || c.hdr.total == 0 || c.hdr.seq >= c.hdr.total ||
        c.hdr.len != c.payload.size())
    {
        LOG_ERROR("on_fragment: invalid chunk");
        return;
    }
    const std::uint32_t msg_id = c.hdr.msg_id;

    // retransmit of the message we just finished: answer again, never redeliver
    if (last_ && last_->msg_id == msg_id && !(buf_ && buf_->msg_id == msg_id))
    {
        if (last_->cancelled)
        {
            LOG_DEBUG("on_fragment: ignoring fragment of cancelled msg=%u", msg_id);
            return;
        }
        LOG_DEBUG("on_fragment: msg=%u already finished, re-ACK seq=%u", msg_id,
                  static_cast<unsigned>(c.hdr.seq));
        if (last_->rejected)
            ack(msg_id, 0, last_->total, true);
        else
            ack(msg_id, last_->final_seq, last_->total);
        return;
    }

    // a late copy of an older message must not displace or repeat anything
    if ((buf_ && recently_before(msg_id, buf_->msg_id)) ||
        (last_ && recently_before(msg_id, last_->msg_id)))
    {
        LOG_DEBUG("on_fragment: dropping stale fragment (msg=%u seq=%u)", msg_id,
                  static_cast<unsigned>(c.hdr.seq));
        return;
    }

    if (!buf_ || buf_->msg_id != msg_id)
    {
        if (buf_)
        {
            LOG_WARN("on_fragment: msg=%u superseded by msg=%u, dropping %zu bytes", buf_->msg_id,
                     msg_id, buf_->data.size());
        }
        Buffer b;
        b.msg_id = msg_id;
        b.total  = c.hdr.total;
        buf_     = std::move(b);
    }

    Buffer &b = *buf_;
    if (c.hdr.total != b.total)
    {
        LOG_WARN("on_fragment: total changed mid-message (msg=%u %u -> %u), dropping", msg_id,
                 static_cast<unsigned>(b.total), static_cast<unsigned>(c.hdr.total));
        if (b.expected > 0)
            ack(msg_id, static_cast<std::uint16_t>(b.expected - 1), b.total);
        return;
    }

    if (c.hdr.seq < b.expected)
    {
        // duplicate: our ACK got lost
        LOG_DEBUG("on_fragment: duplicate chunk (msg_id=%u, seq=%u)", msg_id,
                  static_cast<unsigned>(c.hdr.seq));
        ack(msg_id, static_cast<std::uint16_t>(b.expected - 1), b.total);
        return;
    }
    if (c.hdr.seq > b.expected)
    {
        LOG_WARN("on_fragment: gap (msg=%u got seq=%u, expected %u), resyncing", msg_id,
                 static_cast<unsigned>(c.hdr.seq), static_cast<unsigned>(b.expected));
        if (b.expected > 0)
            ack(msg_id, static_cast<std::uint16_t>(b.expected - 1), b.total);
        return;
    }

    if (b.data.size() + c.payload.size() > max_message_bytes_)
    {
        LOG_WARN("on_fragment: msg=%u exceeds %zu bytes", msg_id, max_message_bytes_);
        reject(Reason::Malformed);
        return;
    }

    b.data.append(c.payload.begin(), c.payload.end());
    b.expected++;
    if (b.expected == b.total)
    {
        finalize();
        return;
    }
    ack(msg_id, static_cast<std::uint16_t>(b.expected - 1), b.total);
}

void Reassembler::finalize()
{
    if (!utf8::valid(buf_->data))
    {
        LOG_WARN("finalize: msg=%u is not valid UTF-8", buf_->msg_id);
        reject(Reason::Malformed);
        return;
    }

    Finished f;
    f.msg_id    = buf_->msg_id;
    f.total     = buf_->total;
    f.final_seq = static_cast<std::uint16_t>(buf_->total - 1);
    last_       = f;

    std::string text = std::move(buf_->data);
    buf_.reset();

    // hand over before ACKing: the ACK can start the next message on a synchronous link
    if (on_complete_)
        on_complete_(f.msg_id, text);
    ack(f.msg_id, f.final_seq, f.total);
}

void Reassembler::reject(Reason why)
{
    Finished f;
    f.msg_id   = buf_->msg_id;
    f.total    = buf_->total;
    f.rejected = true;
    last_      = f;
    buf_.reset();

    if (on_error_)
        on_error_(f.msg_id, why);
    ack(f.msg_id, 0, f.total, true);
}

void Reassembler::reset()
{
    buf_.reset();
    last_.reset();
}

bool Reassembler::abort(std::uint32_t msg_id)
{
    if (!buf_ || buf_->msg_id != msg_id)
        return false;

    Finished f;
    f.msg_id    = msg_id;
    f.total     = buf_->total;
    f.cancelled = true;
    last_       = f;
    buf_.reset();

    if (on_error_)
        on_error_(msg_id, Reason::Cancelled);
    return true;
}

void Reassembler::ack(std::uint32_t msg_id, std::uint16_t seq, std::uint16_t total, bool refuse)
{
    auto frame = serialize(make_ack(msg_id, seq, total, refuse));
    if (frame.empty())
        return;
    if (!tx_ || !tx_(frame))
    {
        // the sender will retransmit and we will answer again
        LOG_WARN("ack: channel unavailable (msg=%u seq=%u)", msg_id, static_cast<unsigned>(seq));
    }
}

}  // namespace frag
