/**
 * @file websocket_client.h
 * @brief LoanVoice - RFC 6455 client over POSIX sockets
 *
 * Plain ws:// only; wss:// URLs fail with a Transport error. One I/O thread
 * per connection resolves, connects, performs the upgrade handshake and
 * then reads frames until the connection ends.
 */

#ifndef LOANVOICE_NETWORK_WEBSOCKET_CLIENT_H
#define LOANVOICE_NETWORK_WEBSOCKET_CLIENT_H

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "loanvoice/network/url.h"
#include "loanvoice/network/websocket_transport.h"

namespace loanvoice {

struct WebSocketClientConfig {
    int connect_timeout_ms = 5000;
    int handshake_timeout_ms = 5000;
};

class WebSocketClient : public WebSocketTransport {
public:
    WebSocketClient();
    explicit WebSocketClient(const WebSocketClientConfig& config);
    ~WebSocketClient() override;

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void connect(const std::string& url, WebSocketCallbacks callbacks) override;
    bool send_text(const std::string& payload) override;
    bool send_binary(const uint8_t* data, size_t len) override;
    void close() override;

    bool is_open() const { return open_; }

private:
    void run(std::string url);
    bool tcp_connect(const WsUrl& url, std::string& error);
    bool ws_handshake(const WsUrl& url, std::string& error);
    void run_receive_loop();
    bool send_frame(uint8_t opcode, const uint8_t* data, size_t len);
    void fail(const Error& error);

    WebSocketClientConfig config_;
    WebSocketCallbacks callbacks_;

    std::thread io_thread_;
    std::atomic<int> socket_fd_{-1};
    std::atomic<bool> running_{false};
    std::atomic<bool> open_{false};
    std::atomic<bool> close_sent_{false};
    std::mutex write_mutex_;

    // Bytes read past the end of the handshake response
    std::string pending_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_NETWORK_WEBSOCKET_CLIENT_H
