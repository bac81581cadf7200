#include <cstdint>
#include <deque>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

#include "app/link_service.hpp"
#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"

using namespace transport;

namespace
{

// One end of an in-memory cable. Frames wait in the peer's inbox until pump().
class PairEnd final : public ITransport
{
  public:
    PairEnd *peer = nullptr;
    bool     up   = true;

    bool start(const Settings &, OnFrame on_rx) override
    {
        on_rx_   = std::move(on_rx);
        started_ = true;
        return true;
    }
    bool send(const Frame &f) override
    {
        if (!started_ || !up || !peer)
            return false;
        peer->inbox_.push_back(f);
        return true;
    }
    void        stop() override { started_ = false; }
    std::string name() const override { return "pair"; }
    bool        link_ready() const override { return started_ && up; }

    bool deliver_one()
    {
        if (inbox_.empty())
            return false;
        Frame f = inbox_.front();
        inbox_.pop_front();
        if (on_rx_)
            on_rx_(f);
        return true;
    }

  private:
    OnFrame           on_rx_{};
    std::deque<Frame> inbox_;
    bool              started_ = false;
};

void pump_both(PairEnd &a, PairEnd &b)
{
    while (a.deliver_one() | b.deliver_one())
    {
    }
}

config::LinkConfig small_frames()
{
    config::LinkConfig cfg;
    cfg.frame_mtu      = 13 + 16;  // 16-byte fragments
    cfg.ack_timeout_ms = 1000;
    cfg.max_retries    = 3;
    return cfg;
}

struct Pair
{
    PairEnd                    phone_end, watch_end;
    config::LinkConfig         cfg;
    app::LinkService           phone;
    app::LinkService           watch;
    std::vector<frag::Outcome> outcomes;
    std::vector<std::string>   texts;

    explicit Pair(config::LinkConfig c = small_frames())
        : cfg(c), phone(phone_end, cfg, 1), watch(watch_end, cfg, 5000)
    {
        phone_end.peer = &watch_end;
        watch_end.peer = &phone_end;
        phone.set_on_outcome([this](const frag::Outcome &o) { outcomes.push_back(o); });
        watch.set_on_text(
            [this](std::uint32_t, const std::string &t) { texts.push_back(t); });
        EXPECT_TRUE(phone.start(false));
        EXPECT_TRUE(watch.start(false));
    }

    void pump() { pump_both(phone_end, watch_end); }
};

}  // namespace

TEST(LinkService, LoopbackRoundTrip)
{
    LoopbackTransport t;
    app::LinkService  svc(t, small_frames(), 7);

    std::vector<std::string>   texts;
    std::optional<frag::Outcome> out;
    svc.set_on_text([&](std::uint32_t, const std::string &s) { texts.push_back(s); });
    svc.set_on_outcome([&](const frag::Outcome &o) { out = o; });
    ASSERT_TRUE(svc.start(false));

    const std::string text = "a loopback message spanning several sixteen byte fragments";
    auto              id   = svc.send_text(text);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, 7u);

    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->delivered);
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0], text);

    const auto st = svc.status();
    EXPECT_FALSE(st.sending.has_value());
    EXPECT_FALSE(st.receiving.has_value());
    EXPECT_EQ(st.delivered, 1u);
    EXPECT_EQ(st.received, 1u);
    svc.stop();
}

TEST(LinkService, QueuesSendsInOrder)
{
    Pair p;
    auto a = p.phone.send_text("first message, long enough to need fragments");
    auto b = p.phone.send_text("second");
    auto c = p.phone.send_text("third");
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(*b, *a + 1);
    EXPECT_EQ(*c, *b + 1);

    auto st = p.phone.status();
    ASSERT_TRUE(st.sending.has_value());
    EXPECT_EQ(*st.sending, *a);
    EXPECT_EQ(st.queued, 2u);

    p.pump();
    ASSERT_EQ(p.texts.size(), 3u);
    EXPECT_EQ(p.texts[0], "first message, long enough to need fragments");
    EXPECT_EQ(p.texts[1], "second");
    EXPECT_EQ(p.texts[2], "third");
    ASSERT_EQ(p.outcomes.size(), 3u);
    for (const auto &o : p.outcomes)
        EXPECT_TRUE(o.delivered);
    EXPECT_EQ(p.phone.status().queued, 0u);
}

TEST(LinkService, AbortQueuedMessage)
{
    Pair p;
    auto a = p.phone.send_text("stays");
    auto b = p.phone.send_text("goes away");
    ASSERT_TRUE(a && b);

    EXPECT_TRUE(p.phone.abort(*b));
    ASSERT_EQ(p.outcomes.size(), 1u);
    EXPECT_EQ(p.outcomes[0].msg_id, *b);
    EXPECT_EQ(p.outcomes[0].reason, frag::Reason::Cancelled);

    p.pump();
    ASSERT_EQ(p.texts.size(), 1u);
    EXPECT_EQ(p.texts[0], "stays");
    EXPECT_FALSE(p.phone.abort(*b));
}

TEST(LinkService, AbortActiveStartsNextQueued)
{
    Pair p;
    auto a = p.phone.send_text("this one is cancelled before any ACK");
    auto b = p.phone.send_text("next");
    ASSERT_TRUE(a && b);

    EXPECT_TRUE(p.phone.abort(*a));
    auto st = p.phone.status();
    ASSERT_TRUE(st.sending.has_value());
    EXPECT_EQ(*st.sending, *b);

    p.pump();
    ASSERT_FALSE(p.texts.empty());
    EXPECT_EQ(p.texts.back(), "next");
    EXPECT_EQ(p.phone.status().failed, 1u);
}

TEST(LinkService, ChannelDownFailsThenQueueMovesOn)
{
    Pair p;
    p.phone_end.up = false;
    auto a         = p.phone.send_text("nobody hears this");
    auto b         = p.phone.send_text("later");
    ASSERT_TRUE(a && b);

    for (unsigned i = 0; i <= p.cfg.max_retries; ++i)
        p.phone.tick(p.cfg.ack_timeout_ms);

    ASSERT_EQ(p.outcomes.size(), 1u);
    EXPECT_EQ(p.outcomes[0].msg_id, *a);
    EXPECT_EQ(p.outcomes[0].reason, frag::Reason::ChannelUnavailable);

    p.phone_end.up = true;
    p.phone.tick(p.cfg.ack_timeout_ms);
    p.pump();
    ASSERT_EQ(p.texts.size(), 1u);
    EXPECT_EQ(p.texts[0], "later");
}

TEST(LinkService, LostAcksTimeOut)
{
    Pair p;
    p.watch_end.up = false;  // watch hears, phone never gets an ACK
    auto a         = p.phone.send_text("short");
    ASSERT_TRUE(a);

    for (unsigned i = 0; i <= p.cfg.max_retries; ++i)
    {
        p.pump();
        p.phone.tick(p.cfg.ack_timeout_ms);
    }
    ASSERT_EQ(p.outcomes.size(), 1u);
    EXPECT_EQ(p.outcomes[0].reason, frag::Reason::Timeout);
    EXPECT_EQ(p.texts.size(), 1u);  // delivered once despite retransmits
}

TEST(LinkService, WatchRejectsOversizedMessage)
{
    config::LinkConfig cfg = small_frames();
    cfg.max_message_bytes  = 20;
    Pair p(cfg);

    std::vector<frag::Reason> rx_errors;
    p.watch.set_on_rx_error([&](std::uint32_t, frag::Reason r) { rx_errors.push_back(r); });

    ASSERT_TRUE(p.phone.send_text(std::string(40, 'w')));
    p.pump();

    EXPECT_TRUE(p.texts.empty());
    ASSERT_EQ(rx_errors.size(), 1u);
    EXPECT_EQ(rx_errors[0], frag::Reason::Malformed);
    ASSERT_EQ(p.outcomes.size(), 1u);
    EXPECT_EQ(p.outcomes[0].reason, frag::Reason::Malformed);
}

TEST(LinkService, RefusesInvalidUtf8)
{
    Pair p;
    EXPECT_FALSE(p.phone.send_text("bad \xFF text").has_value());
    EXPECT_EQ(p.phone.status().queued, 0u);
    EXPECT_FALSE(p.phone.status().sending.has_value());
}

TEST(LinkService, TailOffSilencesReceivedText)
{
    Pair p;
    p.watch.set_tail(false);

    testing::internal::CaptureStderr();
    ASSERT_TRUE(p.phone.send_text("quiet please"));
    p.pump();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(p.texts.size(), 1u);
    EXPECT_EQ(err.find("[RECV]"), std::string::npos);

    p.watch.set_tail(true);
    testing::internal::CaptureStderr();
    ASSERT_TRUE(p.phone.send_text("loud"));
    p.pump();
    err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[RECV]"), std::string::npos);
    EXPECT_NE(err.find("loud"), std::string::npos);
}

TEST(LinkService, RandomFirstIdsAreConsecutive)
{
    LoopbackTransport t;
    app::LinkService  svc(t, small_frames());
    ASSERT_TRUE(svc.start(false));

    auto a = svc.send_text("one");
    auto b = svc.send_text("two");
    ASSERT_TRUE(a && b);
    EXPECT_EQ(*b, *a + 1);
}
