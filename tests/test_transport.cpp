/**
 * @file test_transport.cpp
 * @brief Tests for the transport session, frame transmitter and notifications
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "loanvoice/core/event_loop.h"
#include "loanvoice/network/frame_transmitter.h"
#include "loanvoice/network/notification_channel.h"
#include "loanvoice/network/transport_session.h"
#include "test_fakes.h"

using namespace loanvoice;
using namespace loanvoice::testing;
using std::chrono::milliseconds;

namespace {

const char* kUrl = "ws://localhost:8000/api/voice/stream";

struct TransportFixture {
    EventLoop loop;
    std::shared_ptr<FakeSocketState> sockets = std::make_shared<FakeSocketState>();
    std::vector<ControlMessage> messages;
    std::vector<std::string> closes;
    std::vector<Error> errors;
    int opens = 0;

    TransportCallbacks callbacks() {
        TransportCallbacks cbs;
        cbs.on_open = [this]() { ++opens; };
        cbs.on_message = [this](ControlMessage&& m) { messages.push_back(std::move(m)); };
        cbs.on_closed = [this](const std::string& reason) { closes.push_back(reason); };
        cbs.on_error = [this](const Error& e) { errors.push_back(e); };
        return cbs;
    }
};

}  // namespace

// =============================================================================
// CONNECT / OPEN
// =============================================================================

TEST(TransportSession, OpensAndRunsReadyOnce) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets));
    transport.set_callbacks(f.callbacks());

    int ready = 0;
    transport.connect(kUrl, "", [&] { ++ready; });
    EXPECT_EQ(transport.state(), SocketState::Connecting);
    ASSERT_EQ(f.sockets->connections.size(), 1u);
    EXPECT_EQ(f.sockets->last()->url, kUrl);

    f.sockets->last()->open();
    EXPECT_FALSE(transport.is_open());  // delivered through the loop
    f.loop.run_pending();

    EXPECT_TRUE(transport.is_open());
    EXPECT_EQ(f.opens, 1);
    EXPECT_EQ(ready, 1);
}

TEST(TransportSession, TokenIsAppendedAsQueryParameter) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets));

    transport.connect(kUrl, "abc/+=");
    EXPECT_EQ(f.sockets->last()->url, std::string(kUrl) + "?token=abc%2F%2B%3D");
}

TEST(TransportSession, SendIsNoOpUnlessOpen) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets));

    EXPECT_FALSE(transport.send_text("{}"));
    transport.connect(kUrl, "");
    EXPECT_FALSE(transport.send_text("{}"));
    EXPECT_FALSE(transport.send_binary({1, 2, 3}));
    EXPECT_TRUE(f.sockets->last()->sent_text.empty());

    f.sockets->last()->open();
    f.loop.run_pending();
    EXPECT_TRUE(transport.send_text("{}"));
    EXPECT_TRUE(transport.send_binary({1, 2, 3}));
    EXPECT_EQ(f.sockets->last()->sent_text.size(), 1u);
    EXPECT_EQ(f.sockets->last()->sent_binary.size(), 1u);
}

TEST(TransportSession, ConnectFailureReportsTransportError) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets));
    transport.set_callbacks(f.callbacks());

    int ready = 0;
    transport.connect(kUrl, "", [&] { ++ready; });
    f.sockets->last()->fail("Connection refused");
    f.loop.run_pending();

    ASSERT_EQ(f.errors.size(), 1u);
    EXPECT_EQ(f.errors[0].kind, ErrorKind::Transport);
    EXPECT_EQ(transport.state(), SocketState::Closed);
    EXPECT_EQ(ready, 0);
    EXPECT_TRUE(f.sockets->last()->closed);
}

// =============================================================================
// INBOUND
// =============================================================================

TEST(TransportSession, MalformedMessagesAreDropped) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets));
    transport.set_callbacks(f.callbacks());
    transport.connect(kUrl, "");
    auto conn = f.sockets->last();
    conn->open();

    conn->receive("not json");
    conn->receive(R"({"no_type":1})");
    conn->receive(R"({"type":"status","data":"listening"})");
    f.loop.run_pending();

    ASSERT_EQ(f.messages.size(), 1u);
    EXPECT_EQ(f.messages[0].type, InboundType::Status);
    EXPECT_EQ(transport.messages_dropped(), 2u);
    EXPECT_TRUE(transport.is_open());
}

TEST(TransportSession, StaleConnectionIsIgnored) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets));
    transport.set_callbacks(f.callbacks());

    transport.connect(kUrl, "");
    auto first = f.sockets->last();
    transport.connect(kUrl, "");
    auto second = f.sockets->last();
    EXPECT_TRUE(first->closed);

    first->open();
    first->receive(R"({"type":"status","data":"old"})");
    f.loop.run_pending();
    EXPECT_EQ(f.opens, 0);
    EXPECT_TRUE(f.messages.empty());
    EXPECT_EQ(transport.state(), SocketState::Connecting);

    second->open();
    f.loop.run_pending();
    EXPECT_EQ(f.opens, 1);
}

TEST(TransportSession, CompletionQueuedBeforeCloseIsDropped) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets));
    transport.set_callbacks(f.callbacks());
    transport.connect(kUrl, "");
    auto conn = f.sockets->last();
    conn->open();
    f.loop.run_pending();

    conn->receive(R"({"type":"status","data":"late"})");
    transport.close();
    f.loop.run_pending();

    EXPECT_TRUE(f.messages.empty());
    EXPECT_EQ(transport.state(), SocketState::Closed);
}

// =============================================================================
// CLOSE AND RECONNECT
// =============================================================================

TEST(TransportSession, PrimaryPolicyNeverReconnects) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets), ReconnectPolicy::primary());
    transport.set_callbacks(f.callbacks());
    transport.connect(kUrl, "");
    f.sockets->last()->open();
    f.loop.run_pending();

    f.sockets->last()->remote_close(1006);
    f.loop.run_pending();
    ASSERT_EQ(f.closes.size(), 1u);
    EXPECT_EQ(transport.state(), SocketState::Closed);

    f.loop.advance_time(milliseconds(60000));
    f.loop.run_pending();
    EXPECT_EQ(f.sockets->connections.size(), 1u);
    EXPECT_EQ(f.loop.pending_timers(), 0u);
}

TEST(TransportSession, AutoPolicyReconnectsWithBackoff) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets),
                               ReconnectPolicy::side_channel());
    std::vector<uint32_t> delays;
    TransportCallbacks cbs = f.callbacks();
    cbs.on_reconnect_scheduled = [&](int, uint32_t delay) { delays.push_back(delay); };
    transport.set_callbacks(std::move(cbs));

    transport.connect(kUrl, "tok");
    f.sockets->last()->fail();
    f.loop.run_pending();
    ASSERT_EQ(delays.size(), 1u);
    EXPECT_EQ(delays[0], 1000u);

    f.loop.advance_time(milliseconds(999));
    f.loop.run_pending();
    EXPECT_EQ(f.sockets->connections.size(), 1u);

    f.loop.advance_time(milliseconds(1));
    f.loop.run_pending();
    ASSERT_EQ(f.sockets->connections.size(), 2u);
    EXPECT_EQ(f.sockets->last()->url, std::string(kUrl) + "?token=tok");

    f.sockets->last()->fail();
    f.loop.run_pending();
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_EQ(delays[1], 2000u);

    // A successful open resets the attempt counter
    f.loop.advance_time(milliseconds(2000));
    f.loop.run_pending();
    f.sockets->last()->open();
    f.loop.run_pending();
    EXPECT_TRUE(transport.is_open());
    EXPECT_EQ(transport.reconnect_attempts(), 0);
}

TEST(TransportSession, AutoPolicyGivesUpAfterMaxAttempts) {
    TransportFixture f;
    ReconnectPolicy policy{true, 2, 100, 1000};
    TransportSession transport(f.loop, fake_socket_factory(f.sockets), policy);
    transport.set_callbacks(f.callbacks());

    transport.connect(kUrl, "");
    for (int i = 0; i < 5; ++i) {
        f.sockets->last()->fail();
        f.loop.run_pending();
        f.loop.advance_time(milliseconds(1000));
        f.loop.run_pending();
    }

    // Initial attempt plus two retries
    EXPECT_EQ(f.sockets->connections.size(), 3u);
    EXPECT_EQ(f.errors.size(), 3u);
    EXPECT_EQ(f.loop.pending_timers(), 0u);
}

TEST(TransportSession, ManualCloseCancelsPendingReconnect) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets),
                               ReconnectPolicy::side_channel());
    transport.connect(kUrl, "");
    f.sockets->last()->fail();
    f.loop.run_pending();
    EXPECT_EQ(f.loop.pending_timers(), 1u);

    transport.close();
    EXPECT_EQ(f.loop.pending_timers(), 0u);
    f.loop.advance_time(milliseconds(5000));
    f.loop.run_pending();
    EXPECT_EQ(f.sockets->connections.size(), 1u);
}

// =============================================================================
// FRAME TRANSMITTER
// =============================================================================

TEST(FrameTransmitter, DropsFramesWhileClosed) {
    TransportFixture f;
    TransportSession transport(f.loop, fake_socket_factory(f.sockets));
    FrameTransmitter transmitter(transport);

    AudioFrame frame;
    frame.bytes = {1, 2, 3, 4};
    frame.sequence = 7;
    EXPECT_FALSE(transmitter.relay(frame));
    EXPECT_EQ(transmitter.frames_dropped(), 1u);

    transport.connect(kUrl, "");
    f.sockets->last()->open();
    f.loop.run_pending();

    EXPECT_TRUE(transmitter.relay(frame));
    EXPECT_EQ(transmitter.frames_sent(), 1u);
    EXPECT_EQ(transmitter.last_sequence(), 7u);
    ASSERT_EQ(f.sockets->last()->sent_binary.size(), 1u);
    EXPECT_EQ(f.sockets->last()->sent_binary[0], frame.bytes);

    transmitter.reset_counters();
    EXPECT_EQ(transmitter.frames_sent(), 0u);
    EXPECT_EQ(transmitter.frames_dropped(), 0u);
}

// =============================================================================
// NOTIFICATION CHANNEL
// =============================================================================

TEST(NotificationChannel, KeepsNewestTwenty) {
    EventLoop loop;
    auto sockets = std::make_shared<FakeSocketState>();
    NotificationChannel channel(loop, fake_socket_factory(sockets));

    int delivered = 0;
    channel.set_callback([&](const Notification&) { ++delivered; });
    channel.connect("ws://localhost:8000/ws/notifications", "tok");
    auto conn = sockets->last();
    conn->open();
    for (int i = 0; i < 25; ++i) {
        conn->receive(R"({"type":"application_update","seq":)" + std::to_string(i) + "}");
    }
    loop.run_pending();

    EXPECT_TRUE(channel.is_connected());
    EXPECT_EQ(delivered, 25);
    ASSERT_EQ(channel.notifications().size(), NotificationChannel::kMaxNotifications);
    EXPECT_EQ(channel.notifications().front().payload["seq"], 24);
    EXPECT_EQ(channel.notifications().back().payload["seq"], 5);
    EXPECT_EQ(channel.notifications().front().type, "application_update");
}

TEST(NotificationChannel, UnreadCountAndMarkRead) {
    EventLoop loop;
    auto sockets = std::make_shared<FakeSocketState>();
    NotificationChannel channel(loop, fake_socket_factory(sockets));
    channel.connect("ws://localhost:8000/ws/notifications", "");
    auto conn = sockets->last();
    conn->open();
    conn->receive(R"({"type":"document_verified"})");
    conn->receive(R"({"type":"loan_approved"})");
    loop.run_pending();

    EXPECT_EQ(channel.unread_count(), 2u);
    channel.mark_all_read();
    EXPECT_EQ(channel.unread_count(), 0u);

    conn->receive(R"({"type":"loan_disbursed"})");
    loop.run_pending();
    EXPECT_EQ(channel.unread_count(), 1u);
}

TEST(NotificationChannel, ReconnectsAfterDrop) {
    EventLoop loop;
    auto sockets = std::make_shared<FakeSocketState>();
    NotificationChannel channel(loop, fake_socket_factory(sockets));
    channel.connect("ws://localhost:8000/ws/notifications", "");
    sockets->last()->open();
    loop.run_pending();

    sockets->last()->remote_close(1006);
    loop.run_pending();
    EXPECT_FALSE(channel.is_connected());

    loop.advance_time(milliseconds(1000));
    loop.run_pending();
    ASSERT_EQ(sockets->connections.size(), 2u);
    sockets->last()->open();
    loop.run_pending();
    EXPECT_TRUE(channel.is_connected());
}
