// =============================================================================
// Transport Session - Implementation
// =============================================================================

#include "loanvoice/network/transport_session.h"

#include <chrono>

#include "loanvoice/core/logger.h"
#include "loanvoice/network/url.h"

namespace loanvoice {

const char* socket_state_name(SocketState state) {
    switch (state) {
        case SocketState::Closed:     return "closed";
        case SocketState::Connecting: return "connecting";
        case SocketState::Open:       return "open";
        case SocketState::Closing:    return "closing";
    }
    return "unknown";
}

TransportSession::TransportSession(EventLoop& loop, WebSocketFactory factory,
                                   const ReconnectPolicy& policy, const std::string& name)
    : loop_(loop), factory_(std::move(factory)), policy_(policy), name_(name) {}

TransportSession::~TransportSession() {
    close();
}

void TransportSession::connect(const std::string& url, const std::string& token,
                               std::function<void()> on_ready) {
    if (reconnect_timer_) {
        loop_.cancel_timer(reconnect_timer_);
        reconnect_timer_ = 0;
    }
    if (transport_) {
        LV_LOG_DEBUG(name_.c_str(), "Closing previous connection (%s)", socket_state_name(state_));
        release_transport();
    }

    manual_close_ = false;
    reconnect_attempts_ = 0;
    url_ = token.empty() ? url : append_query_param(url, "token", token);
    on_ready_ = std::move(on_ready);
    open_transport();
}

void TransportSession::open_transport() {
    Generation::Value gen = generation_->advance();
    last_error_ = Error{};

    transport_ = factory_ ? factory_() : nullptr;
    if (!transport_) {
        state_ = SocketState::Closed;
        last_error_ = make_error(ErrorKind::Transport, "No transport available");
        if (callbacks_.on_error) callbacks_.on_error(last_error_);
        return;
    }

    state_ = SocketState::Connecting;
    LV_LOG_INFO(name_.c_str(), "Connecting (generation %llu)", static_cast<unsigned long long>(gen));

    std::weak_ptr<Generation> weak = generation_;
    auto guarded = [this, weak, gen](std::function<void()> fn) {
        loop_.post([weak, gen, fn = std::move(fn)]() {
            auto alive = weak.lock();
            if (!alive || !alive->is_current(gen)) return;
            fn();
        });
    };

    WebSocketCallbacks cbs;
    cbs.on_open = [this, guarded]() { guarded([this]() { handle_open(); }); };
    cbs.on_text = [this, guarded](std::string text) {
        guarded([this, text = std::move(text)]() { handle_text(text); });
    };
    cbs.on_binary = [this, guarded](std::vector<uint8_t> data) {
        size_t size = data.size();
        guarded([this, size]() {
            LV_LOG_DEBUG(name_.c_str(), "Ignoring %zu-byte binary message", size);
        });
    };
    cbs.on_close = [this, guarded](int code, const std::string& reason) {
        std::string text = reason.empty() ? "code " + std::to_string(code)
                                          : reason + " (code " + std::to_string(code) + ")";
        guarded([this, text]() { handle_closed(text); });
    };
    cbs.on_error = [this, guarded](const Error& error) {
        guarded([this, error]() { handle_error(error); });
    };

    transport_->connect(url_, std::move(cbs));
}

void TransportSession::handle_open() {
    state_ = SocketState::Open;
    reconnect_attempts_ = 0;
    LV_LOG_INFO(name_.c_str(), "Connection open");

    if (callbacks_.on_open) {
        callbacks_.on_open();
    }
    if (on_ready_ && state_ == SocketState::Open) {
        auto ready = std::move(on_ready_);
        on_ready_ = nullptr;
        ready();
    }
}

void TransportSession::handle_text(const std::string& text) {
    ControlMessage message;
    Error error;
    if (!parse_control_message(text, message, error)) {
        ++messages_dropped_;
        LV_LOG_WARNING(name_.c_str(), "Dropping inbound message: %s", error.message.c_str());
        return;
    }
    if (callbacks_.on_message) {
        callbacks_.on_message(std::move(message));
    }
}

void TransportSession::handle_closed(const std::string& reason) {
    LV_LOG_INFO(name_.c_str(), "Connection closed: %s", reason.c_str());
    release_transport();
    state_ = SocketState::Closed;
    on_ready_ = nullptr;

    if (callbacks_.on_closed) {
        callbacks_.on_closed(reason);
    }
    maybe_schedule_reconnect();
}

void TransportSession::handle_error(const Error& error) {
    last_error_ = error;
    release_transport();
    state_ = SocketState::Closed;
    on_ready_ = nullptr;

    if (callbacks_.on_error) {
        callbacks_.on_error(error);
    }
    maybe_schedule_reconnect();
}

void TransportSession::maybe_schedule_reconnect() {
    if (manual_close_ || state_ != SocketState::Closed ||
        !policy_.should_retry(reconnect_attempts_)) {
        if (policy_.auto_reconnect && !manual_close_ &&
            reconnect_attempts_ >= policy_.max_attempts) {
            LV_LOG_WARNING(name_.c_str(), "Giving up after %d reconnect attempts",
                           reconnect_attempts_);
        }
        return;
    }

    uint32_t delay = policy_.delay_for_attempt(reconnect_attempts_);
    ++reconnect_attempts_;
    LV_LOG_INFO(name_.c_str(), "Reconnecting in %u ms (attempt %d/%d)", delay, reconnect_attempts_,
                policy_.max_attempts);

    std::weak_ptr<Generation> weak = generation_;
    reconnect_timer_ = loop_.post_delayed(std::chrono::milliseconds(delay), [this, weak]() {
        if (!weak.lock()) return;
        reconnect_timer_ = 0;
        if (manual_close_ || state_ != SocketState::Closed) return;
        open_transport();
    });

    if (callbacks_.on_reconnect_scheduled) {
        callbacks_.on_reconnect_scheduled(reconnect_attempts_, delay);
    }
}

bool TransportSession::send_text(const std::string& payload) {
    if (state_ != SocketState::Open || !transport_) {
        return false;
    }
    return transport_->send_text(payload);
}

bool TransportSession::send_binary(const std::vector<uint8_t>& data) {
    if (state_ != SocketState::Open || !transport_) {
        return false;
    }
    return transport_->send_binary(data.data(), data.size());
}

void TransportSession::close() {
    manual_close_ = true;
    on_ready_ = nullptr;
    if (reconnect_timer_) {
        loop_.cancel_timer(reconnect_timer_);
        reconnect_timer_ = 0;
    }
    if (!transport_) {
        state_ = SocketState::Closed;
        return;
    }

    state_ = SocketState::Closing;
    release_transport();
    state_ = SocketState::Closed;
    LV_LOG_INFO(name_.c_str(), "Connection closed by client");
}

void TransportSession::release_transport() {
    // Completions still in flight for this socket become stale
    generation_->advance();
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

}  // namespace loanvoice
