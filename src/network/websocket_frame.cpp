// =============================================================================
// WebSocket Frame Codec - Implementation
// =============================================================================

#include "loanvoice/network/websocket_frame.h"

#include <algorithm>
#include <random>

namespace loanvoice {

std::vector<uint8_t> ws_encode_frame(WsOpcode opcode, const uint8_t* payload, size_t len,
                                     const uint8_t mask[4], bool fin) {
    std::vector<uint8_t> frame;
    frame.reserve(len + 14);

    frame.push_back((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));

    // Payload length + mask bit (client frames must be masked)
    if (len <= 125) {
        frame.push_back(0x80 | static_cast<uint8_t>(len));
    } else if (len <= 65535) {
        frame.push_back(0x80 | 126);
        frame.push_back((len >> 8) & 0xFF);
        frame.push_back(len & 0xFF);
    } else {
        frame.push_back(0x80 | 127);
        for (int i = 7; i >= 0; i--) {
            frame.push_back((static_cast<uint64_t>(len) >> (8 * i)) & 0xFF);
        }
    }

    frame.insert(frame.end(), mask, mask + 4);

    for (size_t i = 0; i < len; i++) {
        frame.push_back(payload[i] ^ mask[i % 4]);
    }
    return frame;
}

std::vector<uint8_t> ws_encode_frame(WsOpcode opcode, const uint8_t* payload, size_t len) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    uint8_t mask[4];
    for (int i = 0; i < 4; i++) mask[i] = static_cast<uint8_t>(rng() & 0xFF);
    return ws_encode_frame(opcode, payload, len, mask, true);
}

std::vector<uint8_t> ws_close_payload(uint16_t code, const std::string& reason) {
    std::vector<uint8_t> payload;
    payload.push_back((code >> 8) & 0xFF);
    payload.push_back(code & 0xFF);
    // Control frame payloads are limited to 125 bytes
    size_t n = std::min<size_t>(reason.size(), 123);
    payload.insert(payload.end(), reason.begin(), reason.begin() + n);
    return payload;
}

WsParseStatus ws_parse_frame(const uint8_t* data, size_t size, WsFrame& out, size_t& consumed,
                             std::string& error) {
    consumed = 0;
    if (size < 2) return WsParseStatus::NeedMore;

    if (data[0] & 0x70) {
        error = "Reserved bits set without a negotiated extension";
        return WsParseStatus::Error;
    }

    out.fin = (data[0] & 0x80) != 0;
    uint8_t op = data[0] & 0x0F;
    switch (op) {
        case 0x0: case 0x1: case 0x2: case 0x8: case 0x9: case 0xA:
            break;
        default:
            error = "Unknown opcode " + std::to_string(op);
            return WsParseStatus::Error;
    }
    out.opcode = static_cast<WsOpcode>(op);

    bool masked = (data[1] & 0x80) != 0;
    uint64_t payload_len = data[1] & 0x7F;
    size_t pos = 2;

    if (payload_len == 126) {
        if (size < pos + 2) return WsParseStatus::NeedMore;
        payload_len = (static_cast<uint64_t>(data[2]) << 8) | data[3];
        pos += 2;
    } else if (payload_len == 127) {
        if (size < pos + 8) return WsParseStatus::NeedMore;
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | data[pos + i];
        }
        pos += 8;
    }

    if (ws_is_control(out.opcode) && (payload_len > 125 || !out.fin)) {
        error = "Invalid control frame";
        return WsParseStatus::Error;
    }

    // Sanity check
    if (payload_len > kWsMaxFramePayload) {
        error = "Frame payload of " + std::to_string(payload_len) + " bytes exceeds limit";
        return WsParseStatus::Error;
    }

    uint8_t mask_key[4] = {};
    if (masked) {
        if (size < pos + 4) return WsParseStatus::NeedMore;
        for (int i = 0; i < 4; i++) mask_key[i] = data[pos + i];
        pos += 4;
    }

    if (size < pos + payload_len) return WsParseStatus::NeedMore;

    out.payload.assign(data + pos, data + pos + payload_len);
    if (masked) {
        for (size_t i = 0; i < out.payload.size(); i++) {
            out.payload[i] ^= mask_key[i % 4];
        }
    }

    consumed = pos + static_cast<size_t>(payload_len);
    return WsParseStatus::Ok;
}

// =============================================================================
// Fragment reassembly
// =============================================================================

WsMessageAssembler::Result WsMessageAssembler::push(WsFrame&& frame, WsOpcode& message_opcode,
                                                    std::vector<uint8_t>& message,
                                                    std::string& error) {
    if (frame.opcode == WsOpcode::Continuation) {
        if (!in_message_) {
            error = "Continuation frame without a message in progress";
            reset();
            return Result::Error;
        }
    } else {
        if (in_message_) {
            error = "New data frame before previous message finished";
            reset();
            return Result::Error;
        }
        if (frame.fin) {
            // Unfragmented fast path
            message_opcode = frame.opcode;
            message = std::move(frame.payload);
            return Result::Message;
        }
        in_message_ = true;
        opcode_ = frame.opcode;
        buffer_.clear();
    }

    if (buffer_.size() + frame.payload.size() > kWsMaxMessageSize) {
        error = "Reassembled message exceeds limit";
        reset();
        return Result::Error;
    }
    buffer_.insert(buffer_.end(), frame.payload.begin(), frame.payload.end());

    if (!frame.fin) {
        return Result::Pending;
    }

    message_opcode = opcode_;
    message = std::move(buffer_);
    reset();
    return Result::Message;
}

void WsMessageAssembler::reset() {
    in_message_ = false;
    buffer_.clear();
}

}  // namespace loanvoice
