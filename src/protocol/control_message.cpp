// =============================================================================
// Control Message - Implementation
// =============================================================================

#include "loanvoice/protocol/control_message.h"

#include <exception>

namespace loanvoice {

namespace {

struct TypeName {
    InboundType type;
    const char* name;
};

const TypeName kInboundTypes[] = {
    {InboundType::Status, "status"},
    {InboundType::PartialTranscript, "partial_transcript"},
    {InboundType::FinalTranscript, "final_transcript"},
    {InboundType::AssistantTranscript, "assistant_transcript"},
    {InboundType::AiToken, "ai_token"},
    {InboundType::AudioChunk, "audio_chunk"},
    {InboundType::StructuredUpdate, "structured_update"},
    {InboundType::Interrupt, "interrupt"},
    {InboundType::EligibilityResult, "eligibility_result"},
    {InboundType::DocumentVerificationRequired, "document_verification_required"},
    {InboundType::Error, "error"},
};

std::string with_type(const char* type) {
    Json msg;
    msg["type"] = type;
    return msg.dump();
}

std::string document_message(const char* type, const Json& data, const std::string& doc_type) {
    Json msg;
    msg["type"] = type;
    msg["data"] = data;
    if (!doc_type.empty()) {
        msg["docType"] = doc_type;
    }
    return msg.dump();
}

}  // namespace

InboundType inbound_type_from_name(const std::string& name) {
    for (const auto& entry : kInboundTypes) {
        if (name == entry.name) return entry.type;
    }
    return InboundType::Unknown;
}

const char* inbound_type_name(InboundType type) {
    for (const auto& entry : kInboundTypes) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

bool parse_control_message(const std::string& text, ControlMessage& out, Error& error) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::exception& e) {
        error = make_error(ErrorKind::Protocol, std::string("Malformed JSON: ") + e.what());
        return false;
    }

    if (!parsed.is_object()) {
        error = make_error(ErrorKind::Protocol, "Message is not a JSON object");
        return false;
    }

    auto type_it = parsed.find("type");
    if (type_it == parsed.end() || !type_it->is_string()) {
        error = make_error(ErrorKind::Protocol, "Message has no string 'type'");
        return false;
    }

    out.type_name = type_it->get<std::string>();
    out.type = inbound_type_from_name(out.type_name);

    auto data_it = parsed.find("data");
    out.data = (data_it != parsed.end()) ? *data_it : Json();
    out.body = std::move(parsed);
    return true;
}

std::string payload_text(const Json& data) {
    if (data.is_string()) return data.get<std::string>();
    if (data.is_null()) return "";
    return data.dump();
}

// =============================================================================
// Outbound builders
// =============================================================================

namespace outbound {

std::string text_input(const std::string& text) {
    Json msg;
    msg["type"] = "text_input";
    msg["data"] = text;
    return msg.dump();
}

std::string document_uploaded(const Json& data, const std::string& doc_type) {
    return document_message("document_uploaded", data, doc_type);
}

std::string document_verified(const Json& data, const std::string& doc_type) {
    return document_message("document_verified", data, doc_type);
}

std::string verification_completed() {
    return with_type("verification_completed");
}

std::string interaction_end() {
    return with_type("interaction_end");
}

std::string debug_log(const std::string& message) {
    Json msg;
    msg["type"] = "debug_log";
    msg["message"] = message;
    return msg.dump();
}

std::string end_of_session() {
    return with_type("end_of_session");
}

}  // namespace outbound

}  // namespace loanvoice
