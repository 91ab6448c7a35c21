/**
 * @file notification_channel.h
 * @brief LoanVoice - Secondary notifications side channel
 *
 * Receives JSON notifications with a `type` field over its own WebSocket and
 * keeps the newest 20. Unlike the voice channel it reconnects automatically
 * with exponential backoff.
 */

#ifndef LOANVOICE_NETWORK_NOTIFICATION_CHANNEL_H
#define LOANVOICE_NETWORK_NOTIFICATION_CHANNEL_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>

#include "loanvoice/network/transport_session.h"

namespace loanvoice {

struct Notification {
    uint64_t id = 0;  ///< Local id, increasing
    std::string type;
    Json payload;     ///< Full message as received
    bool read = false;
    std::chrono::system_clock::time_point received_at;
};

class NotificationChannel {
public:
    static constexpr size_t kMaxNotifications = 20;

    using NotificationCallback = std::function<void(const Notification& notification)>;

    NotificationChannel(EventLoop& loop, WebSocketFactory factory,
                        const ReconnectPolicy& policy = ReconnectPolicy::side_channel());

    void set_callback(NotificationCallback callback) { on_notification_ = std::move(callback); }

    void connect(const std::string& url, const std::string& token);

    // Manual close; no reconnect follows
    void close();

    bool is_connected() const { return transport_.is_open(); }

    // Newest first
    const std::deque<Notification>& notifications() const { return notifications_; }
    size_t unread_count() const;
    void mark_all_read();

    const TransportSession& transport() const { return transport_; }

private:
    void handle_message(const ControlMessage& message);

    TransportSession transport_;
    std::deque<Notification> notifications_;
    uint64_t next_id_ = 1;
    NotificationCallback on_notification_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_NETWORK_NOTIFICATION_CHANNEL_H
