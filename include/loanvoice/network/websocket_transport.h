/**
 * @file websocket_transport.h
 * @brief LoanVoice - WebSocket transport abstraction
 *
 * Callbacks fire on the transport's own thread. Consumers post them onto the
 * event loop; nothing here touches conversation state.
 */

#ifndef LOANVOICE_NETWORK_WEBSOCKET_TRANSPORT_H
#define LOANVOICE_NETWORK_WEBSOCKET_TRANSPORT_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "loanvoice/core/error.h"

namespace loanvoice {

struct WebSocketCallbacks {
    std::function<void()> on_open;
    std::function<void(std::string text)> on_text;
    std::function<void(std::vector<uint8_t> data)> on_binary;
    // Connection ended after it was open
    std::function<void(int code, const std::string& reason)> on_close;
    // Connect or handshake failed; no on_open/on_close follow
    std::function<void(const Error& error)> on_error;
};

class WebSocketTransport {
public:
    virtual ~WebSocketTransport() = default;

    // Begin connecting in the background
    virtual void connect(const std::string& url, WebSocketCallbacks callbacks) = 0;

    virtual bool send_text(const std::string& payload) = 0;
    virtual bool send_binary(const uint8_t* data, size_t len) = 0;

    // Send a close frame, tear down the socket and join the I/O thread. Idempotent.
    virtual void close() = 0;
};

using WebSocketFactory = std::function<std::unique_ptr<WebSocketTransport>()>;

}  // namespace loanvoice

#endif  // LOANVOICE_NETWORK_WEBSOCKET_TRANSPORT_H
