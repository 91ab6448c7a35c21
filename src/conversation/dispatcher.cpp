// =============================================================================
// Dispatcher - Implementation
// =============================================================================

#include "loanvoice/conversation/dispatcher.h"

#include "loanvoice/conversation/structured_data.h"
#include "loanvoice/core/logger.h"

namespace loanvoice {

// =============================================================================
// Event / effect helpers
// =============================================================================

Event Event::inbound(ControlMessage message) {
    Event event;
    event.kind = Kind::Inbound;
    event.message = std::move(message);
    return event;
}

Event Event::of(Kind kind) {
    Event event;
    event.kind = kind;
    return event;
}

Event Event::failure(Kind kind, const Error& error) {
    Event event;
    event.kind = kind;
    event.error = error;
    return event;
}

Event Event::proceed(const std::string& application_id) {
    Event event;
    event.kind = Kind::ProceedToVerification;
    event.text = application_id;
    return event;
}

const char* event_kind_name(Event::Kind kind) {
    switch (kind) {
        case Event::Kind::Inbound:               return "inbound";
        case Event::Kind::Connecting:            return "connecting";
        case Event::Kind::Connected:             return "connected";
        case Event::Kind::ConnectFailed:         return "connect_failed";
        case Event::Kind::Disconnected:          return "disconnected";
        case Event::Kind::RecordingStarted:      return "recording_started";
        case Event::Kind::CaptureFailed:         return "capture_failed";
        case Event::Kind::EndCallRequested:      return "end_call";
        case Event::Kind::PlaybackIdle:          return "playback_idle";
        case Event::Kind::ProceedToVerification: return "proceed_to_verification";
        case Event::Kind::NewChat:               return "new_chat";
    }
    return "unknown";
}

const char* effect_kind_name(Effect::Kind kind) {
    switch (kind) {
        case Effect::Kind::EnqueueAudio:              return "enqueue_audio";
        case Effect::Kind::FlushPlayback:             return "flush_playback";
        case Effect::Kind::StopCapture:               return "stop_capture";
        case Effect::Kind::SendInteractionEnd:        return "send_interaction_end";
        case Effect::Kind::ShowEligibility:           return "show_eligibility";
        case Effect::Kind::StartVerification:         return "start_verification";
        case Effect::Kind::RequireVerificationAction: return "require_verification_action";
        case Effect::Kind::SurfaceError:              return "surface_error";
    }
    return "unknown";
}

std::string speakable_text(const std::string& assistant_buffer) {
    auto pos = assistant_buffer.find(kAssistantMetadataDelimiter);
    return pos == std::string::npos ? assistant_buffer : assistant_buffer.substr(0, pos);
}

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

Effect make_effect(Effect::Kind kind) {
    Effect effect{};
    effect.kind = kind;
    return effect;
}

Effect error_effect(const Error& error) {
    Effect effect = make_effect(Effect::Kind::SurfaceError);
    effect.error = error;
    return effect;
}

// Blank text commits nothing
bool commit(ConversationState& state, Role role, const std::string& text,
            std::chrono::system_clock::time_point at) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return false;
    state.utterance_log.push_back(Utterance{role, std::move(trimmed), at});
    return true;
}

void flush_assistant_buffer(ConversationState& state, std::chrono::system_clock::time_point at) {
    if (state.current_assistant_buffer.empty()) return;
    commit(state, Role::Assistant, speakable_text(state.current_assistant_buffer), at);
    state.current_assistant_buffer.clear();
}

CallPhase idle_phase(const ConversationState& state) {
    return state.connection_status == ConnectionStatus::Connected ? CallPhase::ConnectedIdle
                                                                  : CallPhase::Disconnected;
}

// Barge-in: stop assistant audio without touching the recording state
void halt_playback(ConversationState& state, Effects& effects) {
    effects.push_back(make_effect(Effect::Kind::FlushPlayback));
    if (state.assistant_speaking && state.phase == CallPhase::Recording) {
        state.phase = CallPhase::RecordingPlaybackInterrupted;
    }
    state.assistant_speaking = false;
}

void end_call(ConversationState& state, Effects& effects, bool notify_server) {
    if (state.recording) {
        effects.push_back(make_effect(Effect::Kind::StopCapture));
        if (notify_server && state.connection_status == ConnectionStatus::Connected) {
            effects.push_back(make_effect(Effect::Kind::SendInteractionEnd));
        }
    }
    state.recording = false;
    state.phase = idle_phase(state);
}

std::string server_error_text(const ControlMessage& message) {
    if (message.data.is_string()) return message.data.get<std::string>();
    if (message.data.is_object()) {
        auto it = message.data.find("message");
        if (it != message.data.end() && it->is_string()) return it->get<std::string>();
    }
    auto top = message.body.find("message");
    if (top != message.body.end() && top->is_string()) return top->get<std::string>();
    return message.data.is_null() ? "Server error" : message.data.dump();
}

bool blocked_while_frozen(InboundType type) {
    switch (type) {
        case InboundType::PartialTranscript:
        case InboundType::FinalTranscript:
        case InboundType::AssistantTranscript:
        case InboundType::AiToken:
        case InboundType::AudioChunk:
        case InboundType::StructuredUpdate:
        case InboundType::EligibilityResult:
        case InboundType::DocumentVerificationRequired:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Inbound messages
// =============================================================================

Effects reduce_inbound(ConversationState& state, const ControlMessage& message,
                       std::chrono::system_clock::time_point at) {
    Effects effects;

    if (state.frozen && blocked_while_frozen(message.type)) {
        LV_LOG_DEBUG("Dispatcher", "Conversation frozen; ignoring '%s'", message.type_name.c_str());
        return effects;
    }

    switch (message.type) {
        case InboundType::PartialTranscript:
            flush_assistant_buffer(state, at);
            halt_playback(state, effects);
            state.current_partial_text = payload_text(message.data);
            break;

        case InboundType::FinalTranscript:
            flush_assistant_buffer(state, at);
            halt_playback(state, effects);
            commit(state, Role::User, payload_text(message.data), at);
            state.current_partial_text.clear();
            break;

        case InboundType::AssistantTranscript:
            commit(state, Role::Assistant, payload_text(message.data), at);
            break;

        case InboundType::AiToken:
            state.current_assistant_buffer += payload_text(message.data);
            break;

        case InboundType::AudioChunk: {
            if (!message.data.is_string() || message.data.get<std::string>().empty()) {
                LV_LOG_WARNING("Dispatcher", "audio_chunk without a base64 string payload");
                break;
            }
            Effect effect = make_effect(Effect::Kind::EnqueueAudio);
            effect.payload = message.data.get<std::string>();
            effects.push_back(std::move(effect));
            state.assistant_speaking = true;
            if (state.phase == CallPhase::RecordingPlaybackInterrupted) {
                state.phase = CallPhase::Recording;
            }
            break;
        }

        case InboundType::StructuredUpdate: {
            Error error;
            if (!merge_structured_fields(state.structured_fields, message.data, error)) {
                LV_LOG_WARNING("Dispatcher", "%s", error.message.c_str());
            }
            break;
        }

        case InboundType::Interrupt:
            // Discarded, never committed
            state.current_assistant_buffer.clear();
            halt_playback(state, effects);
            break;

        case InboundType::EligibilityResult: {
            flush_assistant_buffer(state, at);
            EligibilityResult result = eligibility_from_payload(message.data, state.structured_fields);
            state.pending_result = result;
            state.frozen = true;
            end_call(state, effects, true);

            Effect effect = make_effect(Effect::Kind::ShowEligibility);
            effect.eligibility = std::move(result);
            effects.push_back(std::move(effect));
            break;
        }

        case InboundType::DocumentVerificationRequired: {
            end_call(state, effects, true);
            flush_assistant_buffer(state, at);

            if (message.data.is_object()) {
                auto extracted = message.data.find("structured_data");
                if (extracted != message.data.end() && !extracted->is_null()) {
                    Error error;
                    if (!merge_structured_fields(state.structured_fields, *extracted, error)) {
                        LV_LOG_WARNING("Dispatcher", "%s", error.message.c_str());
                    }
                }
            }

            VerificationHandoff handoff = verification_from_payload(message.data);
            commit(state, Role::Assistant, handoff.message, at);
            state.verification = handoff;

            Effect effect = make_effect(handoff.awaiting_user_action
                                            ? Effect::Kind::RequireVerificationAction
                                            : Effect::Kind::StartVerification);
            effect.verification = std::move(handoff);
            effects.push_back(std::move(effect));
            break;
        }

        case InboundType::Status:
            state.last_status = payload_text(message.data);
            LV_LOG_INFO("Dispatcher", "Server status: %s", state.last_status.c_str());
            break;

        case InboundType::Error: {
            Error error = make_error(ErrorKind::Server, server_error_text(message));
            state.last_error = error;
            effects.push_back(error_effect(error));
            break;
        }

        case InboundType::Unknown:
            LV_LOG_DEBUG("Dispatcher", "Ignoring unknown message type '%s'",
                         message.type_name.c_str());
            break;
    }

    return effects;
}

}  // namespace

// =============================================================================
// reduce
// =============================================================================

Effects reduce(ConversationState& state, const Event& event) {
    Effects effects;

    switch (event.kind) {
        case Event::Kind::Inbound:
            return reduce_inbound(state, event.message, event.at);

        case Event::Kind::Connecting:
            state.connection_status = ConnectionStatus::Connecting;
            if (!state.recording) state.phase = CallPhase::Connecting;
            break;

        case Event::Kind::Connected:
            state.connection_status = ConnectionStatus::Connected;
            if (!state.recording) state.phase = CallPhase::ConnectedIdle;
            break;

        case Event::Kind::ConnectFailed:
            state.connection_status = ConnectionStatus::Disconnected;
            end_call(state, effects, false);
            state.last_error = event.error;
            effects.push_back(error_effect(event.error));
            break;

        case Event::Kind::Disconnected:
            // The socket is gone, so there is nobody to send interaction_end to
            state.connection_status = ConnectionStatus::Disconnected;
            end_call(state, effects, false);
            break;

        case Event::Kind::RecordingStarted:
            state.recording = true;
            state.phase = CallPhase::Recording;
            break;

        case Event::Kind::CaptureFailed:
            state.recording = false;
            state.phase = idle_phase(state);
            state.last_error = event.error;
            effects.push_back(error_effect(event.error));
            break;

        case Event::Kind::EndCallRequested:
            end_call(state, effects, true);
            break;

        case Event::Kind::PlaybackIdle:
            state.assistant_speaking = false;
            if (state.phase == CallPhase::RecordingPlaybackInterrupted) {
                state.phase = CallPhase::Recording;
            }
            break;

        case Event::Kind::ProceedToVerification: {
            std::string id = trim(event.text);
            bool awaiting = state.verification && state.verification->awaiting_user_action;
            if (!awaiting || id.empty()) {
                LV_LOG_WARNING("Dispatcher", "No verification awaiting an application id");
                break;
            }
            state.verification->application_id = id;
            state.verification->awaiting_user_action = false;

            Effect effect = make_effect(Effect::Kind::StartVerification);
            effect.verification = *state.verification;
            effects.push_back(std::move(effect));
            break;
        }

        case Event::Kind::NewChat:
            state.reset_conversation();
            halt_playback(state, effects);
            break;
    }

    return effects;
}

}  // namespace loanvoice
