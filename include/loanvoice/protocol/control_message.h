/**
 * @file control_message.h
 * @brief LoanVoice - Voice stream control protocol
 *
 * Text frames on the voice stream carry JSON objects of the form
 * `{"type": "...", "data": ...}`. Binary frames carry raw audio and have no
 * envelope, so they never pass through this module.
 */

#ifndef LOANVOICE_PROTOCOL_CONTROL_MESSAGE_H
#define LOANVOICE_PROTOCOL_CONTROL_MESSAGE_H

#include <nlohmann/json.hpp>

#include <string>

#include "loanvoice/core/error.h"

namespace loanvoice {

using Json = nlohmann::json;

// =============================================================================
// Inbound (server -> client)
// =============================================================================

enum class InboundType {
    Status,
    PartialTranscript,
    FinalTranscript,
    AssistantTranscript,
    AiToken,
    AudioChunk,
    StructuredUpdate,
    Interrupt,
    EligibilityResult,
    DocumentVerificationRequired,
    Error,
    Unknown,
};

struct ControlMessage {
    InboundType type = InboundType::Unknown;
    std::string type_name;  ///< Wire name, kept for unknown types
    Json data;              ///< Payload; null when absent
    Json body;              ///< Whole message object
};

InboundType inbound_type_from_name(const std::string& name);
const char* inbound_type_name(InboundType type);

/**
 * @brief Parse one inbound text frame.
 *
 * Unknown `type` values parse successfully as InboundType::Unknown so the
 * dispatcher can log and skip them.
 *
 * @return false with a Protocol error if the frame is not a JSON object
 *         with a string `type`
 */
bool parse_control_message(const std::string& text, ControlMessage& out, Error& error);

/**
 * @brief Payload as display text: strings verbatim, null as "", anything
 * else serialized.
 */
std::string payload_text(const Json& data);

// =============================================================================
// Outbound (client -> server)
// =============================================================================

namespace outbound {

std::string text_input(const std::string& text);

// doc_type is omitted from the message when empty
std::string document_uploaded(const Json& data, const std::string& doc_type = "");
std::string document_verified(const Json& data, const std::string& doc_type = "");

std::string verification_completed();
std::string interaction_end();
std::string debug_log(const std::string& message);
std::string end_of_session();

}  // namespace outbound

}  // namespace loanvoice

#endif  // LOANVOICE_PROTOCOL_CONTROL_MESSAGE_H
