#include <chrono>
#include <sodium.h>

#include "app/link_service.hpp"
#include "proto/frag.hpp"
#include "proto/utf8.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

// A restarted sender must not reuse the id the receiver last finished, or its first
// message would be taken for a retransmit and silently re-ACKed.
static std::uint32_t random_first_id()
{
    if (sodium_init() < 0)
    {
        LOG_WARN("sodium_init failed; message ids start at 1");
        return 1;
    }
    const std::uint32_t id = randombytes_random();
    return id == 0 ? 1 : id;
}

static frag::SenderConfig sender_config(const config::LinkConfig &cfg)
{
    frag::SenderConfig sc;
    sc.fragment_bytes = cfg.fragment_bytes();
    sc.ack_timeout_ms = cfg.ack_timeout_ms;
    sc.max_retries    = cfg.max_retries;
    return sc;
}

LinkService::LinkService(transport::ITransport &t, const config::LinkConfig &cfg)
    : LinkService(t, cfg, random_first_id())
{
}

LinkService::LinkService(transport::ITransport     &t,
                         const config::LinkConfig &cfg,
                         std::uint32_t             first_msg_id)
    : tx_(t),
      cfg_(cfg),
      seg_([this](const std::vector<std::uint8_t> &f) { return transmit(f); }, sender_config(cfg),
           first_msg_id),
      rx_([this](const std::vector<std::uint8_t> &f) { return transmit(f); },
          cfg.max_message_bytes),
      next_id_(first_msg_id)
{
    seg_.set_on_outcome([this](const frag::Outcome &out) { handle_outcome(out); });

    rx_.set_on_complete([this](std::uint32_t msg_id, const std::string &text) {
        received_++;
        if (tail_enabled_.load(std::memory_order_relaxed))
            LOG_SYSTEM("[RECV] msg=%u %s", msg_id, text.c_str());
        if (on_text_)
            on_text_(msg_id, text);
    });
    rx_.set_on_error([this](std::uint32_t msg_id, frag::Reason reason) {
        LOG_SYSTEM("[FAIL] incoming msg=%u: %s", msg_id, frag::reason_name(reason));
        if (on_rx_error_)
            on_rx_error_(msg_id, reason);
    });
}

LinkService::~LinkService()
{
    stop();
}

bool LinkService::start(bool run_ticker)
{
    // in case a previous ticker is still around
    stop();

    transport::Settings s{};
    s.frame_mtu = cfg_.frame_mtu;
    if (!tx_.start(s, [this](const transport::Frame &f) { this->on_rx(f); }))
    {
        LOG_ERROR("start: transport %s failed to start", tx_.name().c_str());
        return false;
    }
    LOG_INFO("start: transport=%s frame_mtu=%zu fragment=%zu ack_timeout=%ums retries=%u",
             tx_.name().c_str(), cfg_.frame_mtu, cfg_.fragment_bytes(), cfg_.ack_timeout_ms,
             cfg_.max_retries);

    if (!run_ticker)
        return true;

    tick_stop_.store(false);
    tick_thr_ = std::thread([this] {
        using clock = std::chrono::steady_clock;
        auto last   = clock::now();
        while (!tick_stop_.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(constants::TICK_INTERVAL_MS));
            const auto now = clock::now();
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last);
            last          = now;
            tick(static_cast<std::uint64_t>(ms.count()));
        }
    });
    return true;
}

void LinkService::stop()
{
    tick_stop_.store(true);
    if (tick_thr_.joinable())
        tick_thr_.join();
    tx_.stop();
}

std::optional<std::uint32_t> LinkService::send_text(std::string_view text)
{
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (!utf8::valid(text))
    {
        LOG_ERROR("send_text: text is not valid UTF-8, refusing");
        return std::nullopt;
    }

    const std::uint32_t id = next_id_++;
    queue_.push_back(Pending{id, std::string(text)});
    if (seg_.busy())
        LOG_INFO("send_text: msg=%u queued behind msg=%u (%zu waiting)", id, *seg_.active_id(),
                 queue_.size());
    pump_queue();
    return id;
}

void LinkService::pump_queue()
{
    while (!seg_.busy() && !queue_.empty())
    {
        Pending p = std::move(queue_.front());
        queue_.pop_front();
        if (!seg_.send(p.msg_id, p.text))
        {
            // only an oversized text can get here
            handle_outcome(frag::Outcome{p.msg_id, false, frag::Reason::Malformed});
        }
    }
}

void LinkService::handle_outcome(const frag::Outcome &out)
{
    if (out.delivered)
    {
        delivered_++;
        LOG_SYSTEM("[SENT] msg=%u delivered", out.msg_id);
    }
    else
    {
        failed_++;
        LOG_SYSTEM("[FAIL] msg=%u: %s", out.msg_id, frag::reason_name(out.reason));
    }
    if (on_outcome_)
        on_outcome_(out);
    pump_queue();
}

bool LinkService::abort(std::uint32_t msg_id)
{
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (seg_.abort(msg_id))
        return true;

    for (auto it = queue_.begin(); it != queue_.end(); ++it)
    {
        if (it->msg_id == msg_id)
        {
            queue_.erase(it);
            handle_outcome(frag::Outcome{msg_id, false, frag::Reason::Cancelled});
            return true;
        }
    }
    if (rx_.abort(msg_id))
        return true;

    LOG_WARN("abort: no message %u in flight", msg_id);
    return false;
}

void LinkService::tick(std::uint64_t ms)
{
    std::lock_guard<std::recursive_mutex> lk(mu_);
    seg_.tick(ms);
}

void LinkService::on_rx(const transport::Frame &f)
{
    std::lock_guard<std::recursive_mutex> lk(mu_);
    auto c = frag::parse(f);
    if (!c)
    {
        LOG_WARN("on_rx: dropping invalid frame");
        return;
    }
    if (c->is_data())
        rx_.on_fragment(*c);
    else
        seg_.on_ack(*c);
}

bool LinkService::transmit(const std::vector<std::uint8_t> &frame)
{
    return tx_.send(frame);
}

void LinkService::set_on_text(OnText cb)
{
    std::lock_guard<std::recursive_mutex> lk(mu_);
    on_text_ = std::move(cb);
}

void LinkService::set_on_outcome(OnOutcome cb)
{
    std::lock_guard<std::recursive_mutex> lk(mu_);
    on_outcome_ = std::move(cb);
}

void LinkService::set_on_rx_error(OnRxError cb)
{
    std::lock_guard<std::recursive_mutex> lk(mu_);
    on_rx_error_ = std::move(cb);
}

LinkStatus LinkService::status() const
{
    std::lock_guard<std::recursive_mutex> lk(mu_);
    LinkStatus st;
    st.sending   = seg_.active_id();
    st.receiving = rx_.in_flight();
    st.queued    = queue_.size();
    st.delivered = delivered_;
    st.failed    = failed_;
    st.received  = received_;
    return st;
}

}  // namespace app
