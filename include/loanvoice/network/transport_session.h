/**
 * @file transport_session.h
 * @brief LoanVoice - Streaming connection owner
 *
 * Wraps one WebSocketTransport at a time and moves every transport callback
 * onto the event loop. Each connect() starts a new generation; callbacks from
 * a superseded socket are discarded when they reach the loop.
 *
 * Inbound text frames are parsed as control messages before delivery;
 * malformed JSON is logged and dropped.
 */

#ifndef LOANVOICE_NETWORK_TRANSPORT_SESSION_H
#define LOANVOICE_NETWORK_TRANSPORT_SESSION_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "loanvoice/core/error.h"
#include "loanvoice/core/event_loop.h"
#include "loanvoice/core/generation.h"
#include "loanvoice/network/reconnect_policy.h"
#include "loanvoice/network/websocket_transport.h"
#include "loanvoice/protocol/control_message.h"

namespace loanvoice {

enum class SocketState { Closed, Connecting, Open, Closing };

const char* socket_state_name(SocketState state);

// All callbacks run on the event loop thread
struct TransportCallbacks {
    std::function<void()> on_open;
    std::function<void(ControlMessage&& message)> on_message;
    std::function<void(const std::string& reason)> on_closed;
    std::function<void(const Error& error)> on_error;
    // A reconnect attempt has been scheduled (auto policy only)
    std::function<void(int attempt, uint32_t delay_ms)> on_reconnect_scheduled;
};

class TransportSession {
public:
    TransportSession(EventLoop& loop, WebSocketFactory factory,
                     const ReconnectPolicy& policy = ReconnectPolicy::primary(),
                     const std::string& name = "Transport");
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    void set_callbacks(TransportCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    /**
     * @brief Open the connection, closing any previous one first.
     *
     * The token, if non-empty, is appended as a percent-encoded `token`
     * query parameter. `on_ready` runs once after this connection opens.
     */
    void connect(const std::string& url, const std::string& token,
                 std::function<void()> on_ready = {});

    // No-op returning false unless Open
    bool send_text(const std::string& payload);
    bool send_binary(const std::vector<uint8_t>& data);

    // Manual close; suppresses auto-reconnect
    void close();

    SocketState state() const { return state_; }
    bool is_open() const { return state_ == SocketState::Open; }

    const ReconnectPolicy& policy() const { return policy_; }
    int reconnect_attempts() const { return reconnect_attempts_; }

    uint64_t messages_dropped() const { return messages_dropped_; }
    const Error& last_error() const { return last_error_; }

private:
    void open_transport();
    void handle_open();
    void handle_text(const std::string& text);
    void handle_closed(const std::string& reason);
    void handle_error(const Error& error);
    void maybe_schedule_reconnect();
    void release_transport();

    EventLoop& loop_;
    WebSocketFactory factory_;
    ReconnectPolicy policy_;
    std::string name_;

    TransportCallbacks callbacks_;
    std::unique_ptr<WebSocketTransport> transport_;
    std::shared_ptr<Generation> generation_ = std::make_shared<Generation>();

    std::string url_;  ///< Full URL including token
    std::function<void()> on_ready_;
    SocketState state_ = SocketState::Closed;

    int reconnect_attempts_ = 0;
    EventLoop::TimerId reconnect_timer_ = 0;
    bool manual_close_ = false;

    uint64_t messages_dropped_ = 0;
    Error last_error_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_NETWORK_TRANSPORT_SESSION_H
