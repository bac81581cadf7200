#include "proto/segmenter.hpp"
#include "proto/utf8.hpp"
#include "util/log.hpp"

namespace frag
{

Segmenter::Segmenter(Transmit tx, SenderConfig cfg, std::uint32_t first_msg_id)
    : tx_(std::move(tx)), cfg_(cfg), next_id_(first_msg_id)
{
}

std::optional<std::uint32_t> Segmenter::active_id() const
{
    if (!session_)
        return std::nullopt;
    return session_->msg_id;
}

std::optional<std::uint32_t> Segmenter::send(std::string_view text)
{
    return send(next_id_, text);
}

std::optional<std::uint32_t> Segmenter::send(std::uint32_t msg_id, std::string_view text)
{
    if (session_)
    {
        LOG_WARN("send: message %u still in flight, rejecting", session_->msg_id);
        return std::nullopt;
    }
    if (!utf8::valid(text))
    {
        LOG_ERROR("send: text is not valid UTF-8 (%zu bytes)", text.size());
        return std::nullopt;
    }

    auto chunks = make_chunks(msg_id, text, cfg_.fragment_bytes);
    if (chunks.empty())
    {
        LOG_ERROR("send: make_chunks failed");
        return std::nullopt;
    }

    const std::uint32_t id = msg_id;
    next_id_               = msg_id + 1;

    Session s;
    s.msg_id = id;
    s.chunks = std::move(chunks);
    session_ = std::move(s);

    LOG_DEBUG("send: msg=%u bytes=%zu fragments=%zu", id, text.size(), session_->chunks.size());
    // may complete re-entrantly on a synchronous transport; nothing follows it
    transmit_current(false);
    return id;
}

void Segmenter::transmit_current(bool retrans)
{
    Session &s = *session_;
    Chunk    c = s.chunks[s.next_unacked];
    if (retrans)
        c.hdr.flags |= FLAG_RETRANS;

    auto frame = serialize(c);
    if (frame.empty())
    {
        LOG_ERROR("transmit_current: serialize failed (msg=%u seq=%u)", s.msg_id,
                  static_cast<unsigned>(s.next_unacked));
        finish(Outcome{s.msg_id, false, Reason::Malformed});
        return;
    }

    const std::uint32_t id  = s.msg_id;
    const std::uint16_t seq = s.next_unacked;
    s.last_sent             = seq;
    s.elapsed_ms            = 0;
    s.last_tx_failed        = false;

    if (tx_ && tx_(frame))
        return;

    // the ACK path may have replaced the session while tx_ ran
    LOG_WARN("transmit_current: channel unavailable (msg=%u seq=%u)", id,
             static_cast<unsigned>(seq));
    if (session_ && session_->msg_id == id && session_->next_unacked == seq)
    {
        // counts as an expired timer: the next tick() retries or gives up
        session_->last_tx_failed = true;
        session_->elapsed_ms     = cfg_.ack_timeout_ms;
    }
}

void Segmenter::on_ack(const Chunk &ack)
{
    if (!ack.is_ack())
        return;
    if (!session_ || session_->msg_id != ack.hdr.msg_id)
    {
        LOG_DEBUG("on_ack: stale ACK (msg=%u seq=%u)", ack.hdr.msg_id,
                  static_cast<unsigned>(ack.hdr.seq));
        return;
    }

    Session &s = *session_;
    if (ack.hdr.flags & FLAG_REJECT)
    {
        LOG_WARN("on_ack: receiver rejected msg=%u", s.msg_id);
        finish(Outcome{s.msg_id, false, Reason::Malformed});
        return;
    }
    if (ack.hdr.seq < s.next_unacked)
    {
        LOG_DEBUG("on_ack: duplicate ACK (msg=%u seq=%u, waiting for %u)", s.msg_id,
                  static_cast<unsigned>(ack.hdr.seq), static_cast<unsigned>(s.next_unacked));
        return;
    }
    if (static_cast<std::int32_t>(ack.hdr.seq) > s.last_sent)
    {
        LOG_WARN("on_ack: ACK beyond last sent fragment (msg=%u seq=%u last=%d)", s.msg_id,
                 static_cast<unsigned>(ack.hdr.seq), s.last_sent);
        return;
    }

    s.next_unacked = static_cast<std::uint16_t>(ack.hdr.seq + 1);
    s.retry_count  = 0;
    if (s.next_unacked == s.chunks.size())
    {
        finish(Outcome{s.msg_id, true, Reason::Timeout});
        return;
    }
    transmit_current(false);
}

void Segmenter::tick(std::uint64_t ms_since_last_tick)
{
    if (!session_)
        return;

    Session &s = *session_;
    s.elapsed_ms += ms_since_last_tick;
    if (s.elapsed_ms < cfg_.ack_timeout_ms)
        return;

    s.retry_count++;
    if (s.retry_count > cfg_.max_retries)
    {
        const Reason r = s.last_tx_failed ? Reason::ChannelUnavailable : Reason::Timeout;
        LOG_WARN("tick: msg=%u seq=%u gave up after %u retries", s.msg_id,
                 static_cast<unsigned>(s.next_unacked), cfg_.max_retries);
        finish(Outcome{s.msg_id, false, r});
        return;
    }

    LOG_DEBUG("tick: retransmit msg=%u seq=%u (retry %u/%u)", s.msg_id,
              static_cast<unsigned>(s.next_unacked), s.retry_count, cfg_.max_retries);
    transmit_current(true);
}

bool Segmenter::abort(std::uint32_t msg_id)
{
    if (!session_ || session_->msg_id != msg_id)
        return false;
    finish(Outcome{msg_id, false, Reason::Cancelled});
    return true;
}

void Segmenter::finish(Outcome out)
{
    // release first so the callback may send() the next message
    session_.reset();
    if (out.delivered)
        LOG_DEBUG("finish: msg=%u delivered", out.msg_id);
    else
        LOG_DEBUG("finish: msg=%u failed (%s)", out.msg_id, reason_name(out.reason));
    if (on_outcome_)
        on_outcome_(out);
}

}  // namespace frag
