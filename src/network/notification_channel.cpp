// =============================================================================
// Notification Channel - Implementation
// =============================================================================

#include "loanvoice/network/notification_channel.h"

#include "loanvoice/core/logger.h"

namespace loanvoice {

NotificationChannel::NotificationChannel(EventLoop& loop, WebSocketFactory factory,
                                         const ReconnectPolicy& policy)
    : transport_(loop, std::move(factory), policy, "Notify") {
    TransportCallbacks callbacks;
    callbacks.on_message = [this](ControlMessage&& message) { handle_message(message); };
    callbacks.on_error = [](const Error& error) {
        LV_LOG_WARNING("Notify", "Notification channel error: %s", error.message.c_str());
    };
    transport_.set_callbacks(std::move(callbacks));
}

void NotificationChannel::connect(const std::string& url, const std::string& token) {
    transport_.connect(url, token);
}

void NotificationChannel::close() {
    transport_.close();
}

void NotificationChannel::handle_message(const ControlMessage& message) {
    Notification notification;
    notification.id = next_id_++;
    notification.type = message.type_name;
    notification.payload = message.body;
    notification.received_at = std::chrono::system_clock::now();

    LV_LOG_INFO("Notify", "Notification '%s'", notification.type.c_str());

    notifications_.push_front(notification);
    while (notifications_.size() > kMaxNotifications) {
        notifications_.pop_back();
    }

    if (on_notification_) {
        on_notification_(notifications_.front());
    }
}

size_t NotificationChannel::unread_count() const {
    size_t count = 0;
    for (const auto& n : notifications_) {
        if (!n.read) ++count;
    }
    return count;
}

void NotificationChannel::mark_all_read() {
    for (auto& n : notifications_) {
        n.read = true;
    }
}

}  // namespace loanvoice
