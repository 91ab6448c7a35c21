/**
 * @file base64.h
 * @brief LoanVoice - Base64 (RFC 4648 standard alphabet)
 */

#ifndef LOANVOICE_PROTOCOL_BASE64_H
#define LOANVOICE_PROTOCOL_BASE64_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace loanvoice {

std::string base64_encode(const uint8_t* data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

/**
 * @brief Decode a base64 string.
 *
 * ASCII whitespace is skipped and trailing padding may be omitted. Any other
 * character outside the alphabet, misplaced padding, or a dangling single
 * character fails the decode.
 *
 * @return false on malformed input (out is cleared)
 */
bool base64_decode(const std::string& input, std::vector<uint8_t>& out);

}  // namespace loanvoice

#endif  // LOANVOICE_PROTOCOL_BASE64_H
