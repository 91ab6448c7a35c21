// =============================================================================
// WebSocket Client - Implementation
// =============================================================================

#include "loanvoice/network/websocket_client.h"

#include <cerrno>
#include <cstddef>
#include <chrono>
#include <cstring>
#include <random>
#include <sstream>
#include <vector>

// Socket/network
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "loanvoice/core/logger.h"
#include "loanvoice/network/websocket_frame.h"
#include "loanvoice/protocol/base64.h"

namespace loanvoice {

// Poll slice; bounds how long close() waits on a blocked I/O thread
static constexpr int kPollSliceMs = 100;

// =============================================================================
// Socket helpers
// =============================================================================

static bool send_all(int fd, const void* buf, size_t len) {
    size_t total = 0;
    auto* p = static_cast<const uint8_t*>(buf);
    while (total < len) {
        ssize_t n = send(fd, p + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

static bool set_blocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

// =============================================================================
// WebSocketClient
// =============================================================================

WebSocketClient::WebSocketClient() = default;

WebSocketClient::WebSocketClient(const WebSocketClientConfig& config) : config_(config) {}

WebSocketClient::~WebSocketClient() {
    close();
}

void WebSocketClient::connect(const std::string& url, WebSocketCallbacks callbacks) {
    close();

    callbacks_ = std::move(callbacks);
    pending_.clear();
    close_sent_ = false;
    running_ = true;
    io_thread_ = std::thread(&WebSocketClient::run, this, url);
}

void WebSocketClient::close() {
    bool was_running = running_.exchange(false);

    int fd = socket_fd_.load();
    if (fd >= 0) {
        if (was_running && open_ && !close_sent_.exchange(true)) {
            auto payload = ws_close_payload(1000, "client closing");
            send_frame(0x8, payload.data(), payload.size());
        }
        shutdown(fd, SHUT_RDWR);
    }

    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    fd = socket_fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
    open_ = false;
}

bool WebSocketClient::send_text(const std::string& payload) {
    return send_frame(0x1, reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

bool WebSocketClient::send_binary(const uint8_t* data, size_t len) {
    return send_frame(0x2, data, len);
}

bool WebSocketClient::send_frame(uint8_t opcode, const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    int fd = socket_fd_.load();
    if (fd < 0 || !open_) return false;

    std::vector<uint8_t> frame = ws_encode_frame(static_cast<WsOpcode>(opcode), data, len);
    return send_all(fd, frame.data(), frame.size());
}

void WebSocketClient::fail(const Error& error) {
    LV_LOG_ERROR("WebSocket", "%s", error.message.c_str());
    if (running_ && callbacks_.on_error) {
        callbacks_.on_error(error);
    }
}

// =============================================================================
// I/O thread
// =============================================================================

void WebSocketClient::run(std::string url) {
    WsUrl parsed;
    std::string error;
    if (!parse_ws_url(url, parsed, error)) {
        fail(make_error(ErrorKind::Transport, error));
        return;
    }
    if (parsed.secure()) {
        fail(make_error(ErrorKind::Transport,
                        "TLS is not supported; use ws:// instead of " + parsed.scheme + "://"));
        return;
    }

    if (!tcp_connect(parsed, error)) {
        fail(make_error(ErrorKind::Transport, error));
        return;
    }

    if (!ws_handshake(parsed, error)) {
        fail(make_error(ErrorKind::Transport, error));
        return;
    }

    open_ = true;
    LV_LOG_INFO("WebSocket", "Connected to %s:%d%s", parsed.host.c_str(), parsed.port,
                parsed.target.substr(0, parsed.target.find('?')).c_str());
    if (running_ && callbacks_.on_open) {
        callbacks_.on_open();
    }

    run_receive_loop();
}

bool WebSocketClient::tcp_connect(const WsUrl& url, std::string& error) {
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    int gai_err = getaddrinfo(url.host.c_str(), std::to_string(url.port).c_str(), &hints, &result);
    if (gai_err != 0) {
        error = "Failed to resolve host: " + url.host + " (" + gai_strerror(gai_err) + ")";
        return false;
    }

    error = "Failed to connect to " + url.host + ":" + std::to_string(url.port);
    for (struct addrinfo* ai = result; ai != nullptr && running_; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        socket_fd_ = fd;

        // Disable Nagle for low latency
        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

        set_blocking(fd, false);
        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        bool connected = (rc == 0);

        if (!connected && errno == EINPROGRESS) {
            int waited = 0;
            while (running_ && waited < config_.connect_timeout_ms) {
                struct pollfd pfd = {fd, POLLOUT, 0};
                int ret = poll(&pfd, 1, kPollSliceMs);
                if (ret > 0) {
                    int so_error = 0;
                    socklen_t len = sizeof(so_error);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                    connected = (so_error == 0);
                    if (!connected) {
                        error += std::string(": ") + std::strerror(so_error);
                    }
                    break;
                }
                if (ret < 0 && errno != EINTR) break;
                waited += kPollSliceMs;
            }
            if (waited >= config_.connect_timeout_ms) {
                error += " (timed out)";
            }
        }

        if (connected && set_blocking(fd, true)) {
            freeaddrinfo(result);
            return true;
        }

        socket_fd_ = -1;
        ::close(fd);
    }

    freeaddrinfo(result);
    if (!running_) error = "Connect cancelled";
    return false;
}

bool WebSocketClient::ws_handshake(const WsUrl& url, std::string& error) {
    // Random 16-byte key
    std::random_device rd;
    uint8_t key_bytes[16];
    for (int i = 0; i < 16; i++) {
        key_bytes[i] = rd() & 0xFF;
    }
    std::string ws_key = base64_encode(key_bytes, 16);

    std::ostringstream req;
    req << "GET " << url.target << " HTTP/1.1\r\n"
        << "Host: " << url.host << ":" << url.port << "\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Key: " << ws_key << "\r\n"
        << "Sec-WebSocket-Version: 13\r\n"
        << "\r\n";

    int fd = socket_fd_.load();
    std::string request_str = req.str();
    if (!send_all(fd, request_str.data(), request_str.size())) {
        error = "Failed to send WebSocket handshake";
        return false;
    }

    // Read until end of HTTP headers
    std::string response;
    int waited = 0;
    size_t header_end = std::string::npos;
    while (running_ && waited < config_.handshake_timeout_ms) {
        struct pollfd pfd = {fd, POLLIN, 0};
        int ret = poll(&pfd, 1, kPollSliceMs);
        if (ret == 0) {
            waited += kPollSliceMs;
            continue;
        }
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        char buf[1024];
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        response.append(buf, static_cast<size_t>(n));
        header_end = response.find("\r\n\r\n");
        if (header_end != std::string::npos) break;
        if (response.size() > 16 * 1024) break;
    }

    if (header_end == std::string::npos) {
        error = response.empty() ? "WebSocket handshake timed out"
                                 : "WebSocket handshake failed: " + response.substr(0, 80);
        return false;
    }

    std::string status_line = response.substr(0, response.find("\r\n"));
    if (status_line.compare(0, 9, "HTTP/1.1 ") != 0 || status_line.compare(9, 3, "101") != 0) {
        error = "WebSocket handshake rejected: " + status_line;
        return false;
    }

    // Frames the server sent right after the upgrade response
    pending_ = response.substr(header_end + 4);
    return true;
}

void WebSocketClient::run_receive_loop() {
    std::vector<uint8_t> buffer(pending_.begin(), pending_.end());
    pending_.clear();
    WsMessageAssembler assembler;
    int fd = socket_fd_.load();

    auto end_connection = [this](int code, const std::string& reason) {
        open_ = false;
        if (running_ && callbacks_.on_close) {
            callbacks_.on_close(code, reason);
        }
    };

    while (running_) {
        // Drain every complete frame in the buffer
        size_t offset = 0;
        while (offset < buffer.size()) {
            WsFrame frame;
            size_t consumed = 0;
            std::string error;
            WsParseStatus status =
                ws_parse_frame(buffer.data() + offset, buffer.size() - offset, frame, consumed, error);
            if (status == WsParseStatus::NeedMore) break;
            if (status == WsParseStatus::Error) {
                LV_LOG_ERROR("WebSocket", "Protocol error: %s", error.c_str());
                if (!close_sent_.exchange(true)) {
                    auto payload = ws_close_payload(1002, "protocol error");
                    send_frame(0x8, payload.data(), payload.size());
                }
                end_connection(1002, error);
                return;
            }
            offset += consumed;

            switch (frame.opcode) {
                case WsOpcode::Ping:
                    send_frame(0xA, frame.payload.data(), frame.payload.size());
                    continue;
                case WsOpcode::Pong:
                    continue;
                case WsOpcode::Close: {
                    int code = 1005;
                    std::string reason;
                    if (frame.payload.size() >= 2) {
                        code = (frame.payload[0] << 8) | frame.payload[1];
                        reason.assign(frame.payload.begin() + 2, frame.payload.end());
                    }
                    LV_LOG_INFO("WebSocket", "Server closed connection (%d)", code);
                    if (!close_sent_.exchange(true)) {
                        auto payload = ws_close_payload(static_cast<uint16_t>(code == 1005 ? 1000 : code));
                        send_frame(0x8, payload.data(), payload.size());
                    }
                    end_connection(code, reason);
                    return;
                }
                default:
                    break;
            }

            WsOpcode message_opcode;
            std::vector<uint8_t> message;
            WsMessageAssembler::Result result =
                assembler.push(std::move(frame), message_opcode, message, error);
            if (result == WsMessageAssembler::Result::Error) {
                LV_LOG_ERROR("WebSocket", "Protocol error: %s", error.c_str());
                end_connection(1002, error);
                return;
            }
            if (result != WsMessageAssembler::Result::Message || !running_) continue;

            if (message_opcode == WsOpcode::Text) {
                if (callbacks_.on_text) {
                    callbacks_.on_text(std::string(message.begin(), message.end()));
                }
            } else if (callbacks_.on_binary) {
                callbacks_.on_binary(std::move(message));
            }
        }
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));

        struct pollfd pfd = {fd, POLLIN, 0};
        int ret = poll(&pfd, 1, kPollSliceMs);
        if (ret == 0) continue;
        if (ret < 0) {
            if (errno == EINTR) continue;
            end_connection(1006, std::string("poll failed: ") + std::strerror(errno));
            return;
        }

        uint8_t chunk[16 * 1024];
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            end_connection(1006, "Connection lost");
            return;
        }
        buffer.insert(buffer.end(), chunk, chunk + n);
    }
}

}  // namespace loanvoice
