/**
 * @file conversation_state.h
 * @brief LoanVoice - Externally visible conversation state
 *
 * A ConversationState has a single owner (the voice session) and changes only
 * by feeding events through the dispatcher.
 */

#ifndef LOANVOICE_CONVERSATION_CONVERSATION_STATE_H
#define LOANVOICE_CONVERSATION_CONVERSATION_STATE_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "loanvoice/core/error.h"
#include "loanvoice/protocol/control_message.h"

namespace loanvoice {

// =============================================================================
// Utterances
// =============================================================================

enum class Role { User, Assistant };

const char* role_name(Role role);

struct Utterance {
    Role role = Role::User;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

// =============================================================================
// Connection and call phase
// =============================================================================

enum class ConnectionStatus { Disconnected, Connecting, Connected };

const char* connection_status_name(ConnectionStatus status);

enum class CallPhase {
    Idle,
    Connecting,
    ConnectedIdle,
    Recording,
    RecordingPlaybackInterrupted,  ///< User barged in over assistant audio
    Disconnected,
};

const char* call_phase_name(CallPhase phase);

// =============================================================================
// Handoffs to external collaborators
// =============================================================================

struct EligibilityResult {
    std::string eligibility_status = "ineligible";
    double eligibility_score = 0.0;
    std::string risk_level = "medium_risk";
    std::string credit_tier = "Good";
    double confidence = 0.9;
    double debt_to_income_ratio = 0.0;
    std::optional<std::string> application_id;
    Json structured_fields = Json::object();  ///< Accumulated fields at decision time
};

/**
 * @brief Read an eligibility_result payload; absent or mistyped fields keep
 * their defaults.
 */
EligibilityResult eligibility_from_payload(const Json& data, const Json& structured_fields);

struct VerificationHandoff {
    std::optional<std::string> application_id;
    std::vector<std::string> required_documents;
    bool awaiting_user_action = false;  ///< No id from the server yet
    std::string message;
};

// Document categories requested when the server names none
const std::vector<std::string>& default_required_documents();

/**
 * @brief Read a document_verification_required payload.
 */
VerificationHandoff verification_from_payload(const Json& data);

// String ids stay as-is; numeric ids are rendered as text
std::optional<std::string> application_id_from(const Json& value);

// =============================================================================
// ConversationState
// =============================================================================

struct ConversationState {
    ConnectionStatus connection_status = ConnectionStatus::Disconnected;
    CallPhase phase = CallPhase::Idle;
    bool recording = false;
    bool assistant_speaking = false;

    std::string current_partial_text;
    std::string current_assistant_buffer;
    std::vector<Utterance> utterance_log;
    Json structured_fields = Json::object();

    std::optional<EligibilityResult> pending_result;
    bool frozen = false;
    std::optional<VerificationHandoff> verification;

    std::string last_status;
    Error last_error;

    /**
     * @brief "New chat": drop utterances, buffers, fields, result and
     * verification. Connection status and recording are preserved.
     */
    void reset_conversation();
};

}  // namespace loanvoice

#endif  // LOANVOICE_CONVERSATION_CONVERSATION_STATE_H
