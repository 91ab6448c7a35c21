/**
 * @file dispatcher.h
 * @brief LoanVoice - Inbound message dispatcher and call state machine
 *
 * `reduce()` applies one event to the conversation state and returns the
 * effects the session must carry out (enqueue audio, flush playback, stop
 * capture, ...). It performs no I/O, so every turn-taking rule can be
 * exercised without a microphone or socket.
 *
 * Flush-before-overwrite: a pending assistant token buffer is committed as
 * one utterance before any user transcript replaces the current turn. Only
 * the text before the first "|||" in the buffer is committed.
 */

#ifndef LOANVOICE_CONVERSATION_DISPATCHER_H
#define LOANVOICE_CONVERSATION_DISPATCHER_H

#include <chrono>
#include <string>
#include <vector>

#include "loanvoice/conversation/conversation_state.h"
#include "loanvoice/core/error.h"
#include "loanvoice/protocol/control_message.h"

namespace loanvoice {

// Separates speakable text from trailing metadata in assistant tokens
static constexpr const char* kAssistantMetadataDelimiter = "|||";

// =============================================================================
// Events
// =============================================================================

struct Event {
    enum class Kind {
        Inbound,               ///< Control message from the server
        Connecting,
        Connected,
        ConnectFailed,         ///< error set
        Disconnected,          ///< Socket closed after it was open
        RecordingStarted,
        CaptureFailed,         ///< error set
        EndCallRequested,      ///< User action
        PlaybackIdle,          ///< Playback queue drained
        ProceedToVerification, ///< User supplied an application id (text)
        NewChat,
    };

    Kind kind = Kind::Inbound;
    ControlMessage message;
    Error error;
    std::string text;
    std::chrono::system_clock::time_point at = std::chrono::system_clock::now();

    static Event inbound(ControlMessage message);
    static Event of(Kind kind);
    static Event failure(Kind kind, const Error& error);
    static Event proceed(const std::string& application_id);
};

const char* event_kind_name(Event::Kind kind);

// =============================================================================
// Effects
// =============================================================================

struct Effect {
    enum class Kind {
        EnqueueAudio,               ///< payload = base64 audio
        FlushPlayback,
        StopCapture,
        SendInteractionEnd,
        ShowEligibility,            ///< eligibility set
        StartVerification,          ///< verification set, has an id
        RequireVerificationAction,  ///< verification set, no id yet
        SurfaceError,               ///< error set
    };

    Kind kind;
    std::string payload;
    Error error;
    EligibilityResult eligibility;
    VerificationHandoff verification;
};

const char* effect_kind_name(Effect::Kind kind);

using Effects = std::vector<Effect>;

// =============================================================================
// Reducer
// =============================================================================

/**
 * @brief Apply one event. Mutates `state` only; returns effects in the order
 * they must be performed.
 */
Effects reduce(ConversationState& state, const Event& event);

// Text before the first delimiter (what is shown and spoken)
std::string speakable_text(const std::string& assistant_buffer);

}  // namespace loanvoice

#endif  // LOANVOICE_CONVERSATION_DISPATCHER_H
