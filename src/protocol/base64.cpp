// =============================================================================
// Base64 - Implementation
// =============================================================================

#include "loanvoice/protocol/base64.h"

namespace loanvoice {

static const char b64_table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(((len + 2) / 3) * 4);
    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = ((uint32_t)data[i]) << 16;
        if (i + 1 < len) n |= ((uint32_t)data[i + 1]) << 8;
        if (i + 2 < len) n |= data[i + 2];
        result += b64_table[(n >> 18) & 0x3F];
        result += b64_table[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? b64_table[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? b64_table[n & 0x3F] : '=';
    }
    return result;
}

static int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

static bool is_space(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\v';
}

bool base64_decode(const std::string& input, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve((input.size() / 4) * 3);

    uint32_t accum = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (char c : input) {
        if (is_space(c)) continue;

        if (c == '=') {
            ++padding;
            continue;
        }
        // Data after padding is malformed
        if (padding > 0) {
            out.clear();
            return false;
        }

        int v = decode_char(c);
        if (v < 0) {
            out.clear();
            return false;
        }

        accum = (accum << 6) | static_cast<uint32_t>(v);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }

    // A lone trailing symbol carries fewer than 8 bits
    if (symbols % 4 == 1 || padding > 2 || (padding > 0 && (symbols + padding) % 4 != 0)) {
        out.clear();
        return false;
    }

    return true;
}

}  // namespace loanvoice
