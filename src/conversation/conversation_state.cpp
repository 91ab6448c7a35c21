// =============================================================================
// Conversation State - Implementation
// =============================================================================

#include "loanvoice/conversation/conversation_state.h"

namespace loanvoice {

const char* role_name(Role role) {
    return role == Role::User ? "user" : "assistant";
}

const char* connection_status_name(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
    }
    return "unknown";
}

const char* call_phase_name(CallPhase phase) {
    switch (phase) {
        case CallPhase::Idle:                         return "idle";
        case CallPhase::Connecting:                   return "connecting";
        case CallPhase::ConnectedIdle:                return "connected";
        case CallPhase::Recording:                    return "recording";
        case CallPhase::RecordingPlaybackInterrupted: return "recording (playback interrupted)";
        case CallPhase::Disconnected:                 return "disconnected";
    }
    return "unknown";
}

std::optional<std::string> application_id_from(const Json& value) {
    if (value.is_string()) {
        std::string id = value.get<std::string>();
        if (id.empty()) return std::nullopt;
        return id;
    }
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return value.dump();
    }
    return std::nullopt;
}

static std::string string_or(const Json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

static double number_or(const Json& obj, const char* key, double fallback) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_number()) ? it->get<double>() : fallback;
}

EligibilityResult eligibility_from_payload(const Json& data, const Json& structured_fields) {
    EligibilityResult result;
    result.structured_fields = structured_fields.is_object() ? structured_fields : Json::object();
    if (!data.is_object()) {
        return result;
    }

    result.eligibility_status = string_or(data, "eligibility_status", result.eligibility_status);
    result.eligibility_score = number_or(data, "eligibility_score", result.eligibility_score);
    result.risk_level = string_or(data, "risk_level", result.risk_level);
    result.credit_tier = string_or(data, "credit_tier", result.credit_tier);
    result.confidence = number_or(data, "confidence", result.confidence);
    result.debt_to_income_ratio =
        number_or(data, "debt_to_income_ratio", result.debt_to_income_ratio);

    auto id = data.find("application_id");
    if (id != data.end()) {
        result.application_id = application_id_from(*id);
    }
    return result;
}

const std::vector<std::string>& default_required_documents() {
    static const std::vector<std::string> kDocuments = {"aadhaar", "pan", "kyc", "bank", "salary"};
    return kDocuments;
}

VerificationHandoff verification_from_payload(const Json& data) {
    VerificationHandoff handoff;
    handoff.required_documents = default_required_documents();

    if (data.is_object()) {
        auto id = data.find("application_id");
        if (id != data.end()) {
            handoff.application_id = application_id_from(*id);
        }

        auto docs = data.find("required_documents");
        if (docs != data.end() && docs->is_array()) {
            std::vector<std::string> required;
            for (const auto& doc : *docs) {
                if (doc.is_string()) required.push_back(doc.get<std::string>());
            }
            if (!required.empty()) {
                handoff.required_documents = std::move(required);
            }
        }

        handoff.message = string_or(data, "message", "");
    }

    handoff.awaiting_user_action = !handoff.application_id.has_value();
    return handoff;
}

void ConversationState::reset_conversation() {
    current_partial_text.clear();
    current_assistant_buffer.clear();
    utterance_log.clear();
    structured_fields = Json::object();
    pending_result.reset();
    frozen = false;
    verification.reset();
    last_error = Error{};
}

}  // namespace loanvoice
