/**
 * @file websocket_frame.h
 * @brief LoanVoice - RFC 6455 frame codec
 *
 * Pure encode/parse functions with no socket access. Client frames are
 * always masked; server frames may or may not be.
 */

#ifndef LOANVOICE_NETWORK_WEBSOCKET_FRAME_H
#define LOANVOICE_NETWORK_WEBSOCKET_FRAME_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace loanvoice {

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

// Inbound frame payload cap
static constexpr size_t kWsMaxFramePayload = 1024 * 1024;

// Cap on a message reassembled from fragments
static constexpr size_t kWsMaxMessageSize = 8 * 1024 * 1024;

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::Text;
    std::vector<uint8_t> payload;
};

inline bool ws_is_control(WsOpcode op) {
    return (static_cast<uint8_t>(op) & 0x08) != 0;
}

/**
 * @brief Encode one masked client frame with an explicit masking key.
 */
std::vector<uint8_t> ws_encode_frame(WsOpcode opcode, const uint8_t* payload, size_t len,
                                     const uint8_t mask[4], bool fin = true);

/**
 * @brief Encode one masked client frame with a random masking key.
 */
std::vector<uint8_t> ws_encode_frame(WsOpcode opcode, const uint8_t* payload, size_t len);

// Close frame payload: 2-byte status code followed by a UTF-8 reason
std::vector<uint8_t> ws_close_payload(uint16_t code, const std::string& reason = "");

enum class WsParseStatus {
    Ok,        ///< One frame parsed; `consumed` bytes used
    NeedMore,  ///< Incomplete frame in buffer
    Error,     ///< Protocol violation; connection must be failed
};

/**
 * @brief Parse one frame from the front of `data`.
 */
WsParseStatus ws_parse_frame(const uint8_t* data, size_t size, WsFrame& out, size_t& consumed,
                             std::string& error);

/**
 * @brief Reassembles fragmented data messages.
 *
 * Control frames must be handled by the caller before push(); they may be
 * interleaved with fragments.
 */
class WsMessageAssembler {
public:
    enum class Result { Pending, Message, Error };

    Result push(WsFrame&& frame, WsOpcode& message_opcode, std::vector<uint8_t>& message,
                std::string& error);

    void reset();

private:
    bool in_message_ = false;
    WsOpcode opcode_ = WsOpcode::Text;
    std::vector<uint8_t> buffer_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_NETWORK_WEBSOCKET_FRAME_H
