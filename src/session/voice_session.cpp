// =============================================================================
// Voice Session - Implementation
// =============================================================================

#include "loanvoice/session/voice_session.h"

#include <cstdio>

#include "loanvoice/core/event_loop.h"
#include "loanvoice/core/logger.h"
#include "loanvoice/protocol/control_message.h"

namespace loanvoice {

VoiceSession::VoiceSession(EventLoop& loop, const SessionConfig& config, SessionDependencies deps)
    : loop_(loop),
      config_(config),
      deps_(std::move(deps)),
      transport_(loop, deps_.socket_factory, ReconnectPolicy::primary(), "Transport"),
      capture_(loop, deps_.capture_factory, config_.capture),
      transmitter_(transport_),
      playback_(loop, deps_.output_factory) {
    TransportCallbacks callbacks;
    callbacks.on_open = [this]() { dispatch(Event::of(Event::Kind::Connected)); };
    callbacks.on_message = [this](ControlMessage&& message) {
        dispatch(Event::inbound(std::move(message)));
    };
    callbacks.on_closed = [this](const std::string& reason) {
        LV_LOG_WARNING("Session", "Voice channel closed: %s", reason.c_str());
        dispatch(Event::of(Event::Kind::Disconnected));
    };
    callbacks.on_error = [this](const Error& error) {
        dispatch(Event::failure(Event::Kind::ConnectFailed, error));
    };
    transport_.set_callbacks(std::move(callbacks));

    capture_.set_frame_callback([this](AudioFrame&& frame) { handle_frame(std::move(frame)); });
    capture_.set_failure_callback([this](const Error& error) {
        dispatch(Event::failure(Event::Kind::CaptureFailed, error));
    });

    std::weak_ptr<Generation> weak = lifetime_;
    Generation::Value life = lifetime_->current();
    playback_.set_idle_callback([this, weak, life]() {
        // Delivered as its own event, never nested inside effect handling
        loop_.post([this, weak, life]() {
            auto alive = weak.lock();
            if (!alive || !alive->is_current(life)) return;
            dispatch(Event::of(Event::Kind::PlaybackIdle));
        });
    });
}

VoiceSession::~VoiceSession() {
    teardown();
}

// =============================================================================
// Public operations
// =============================================================================

void VoiceSession::connect(std::function<void()> on_ready) {
    if (torn_down_) return;

    // A new socket never inherits an in-flight call
    if (state_.recording) {
        dispatch(Event::of(Event::Kind::EndCallRequested));
    }

    std::string token = deps_.token_provider ? deps_.token_provider->token() : "";
    if (token.empty()) {
        LV_LOG_DEBUG("Session", "Connecting without a token");
    }

    dispatch(Event::of(Event::Kind::Connecting));
    transport_.connect(config_.server_url, token, std::move(on_ready));
}

bool VoiceSession::start_call() {
    if (torn_down_) return false;
    if (state_.recording) return true;

    if (state_.frozen) {
        Error error = make_error(ErrorKind::Session,
                                 "Conversation has a final result; start a new chat first");
        LV_LOG_WARNING("Session", "Cannot start call: %s", error.message.c_str());
        if (deps_.listener) deps_.listener->on_error(error);
        return false;
    }

    if (!transport_.is_open()) {
        Error error = make_error(ErrorKind::Transport, "Not connected");
        LV_LOG_WARNING("Session", "Cannot start call: %s", error.message.c_str());
        if (deps_.listener) deps_.listener->on_error(error);
        return false;
    }

    if (!capture_.start()) {
        dispatch(Event::failure(Event::Kind::CaptureFailed, capture_.last_error()));
        return false;
    }

    frames_since_debug_log_ = 0;
    dispatch(Event::of(Event::Kind::RecordingStarted));
    LV_LOG_INFO("Session", "Call started");
    return true;
}

void VoiceSession::end_call() {
    if (torn_down_) return;
    dispatch(Event::of(Event::Kind::EndCallRequested));
    LV_LOG_INFO("Session", "Call ended (%llu frames sent, %llu dropped)",
                static_cast<unsigned long long>(transmitter_.frames_sent()),
                static_cast<unsigned long long>(transmitter_.frames_dropped()));
}

void VoiceSession::toggle_call() {
    if (torn_down_) return;

    if (state_.recording) {
        end_call();
    } else if (transport_.is_open()) {
        start_call();
    } else {
        // Manual reconnect: the primary channel never retries on its own
        connect([this]() { start_call(); });
    }
}

bool VoiceSession::send_text(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return false;
    }
    return send_control(outbound::text_input(text), "text_input");
}

bool VoiceSession::notify_document_uploaded(const Json& data, const std::string& doc_type) {
    return send_control(outbound::document_uploaded(data, doc_type), "document_uploaded");
}

bool VoiceSession::notify_document_verified(const Json& data, const std::string& doc_type) {
    return send_control(outbound::document_verified(data, doc_type), "document_verified");
}

bool VoiceSession::notify_verification_completed() {
    return send_control(outbound::verification_completed(), "verification_completed");
}

void VoiceSession::proceed_to_verification(const std::string& application_id) {
    if (torn_down_) return;
    dispatch(Event::proceed(application_id));
}

void VoiceSession::new_chat() {
    if (torn_down_) return;
    dispatch(Event::of(Event::Kind::NewChat));
}

void VoiceSession::teardown() {
    if (torn_down_) return;

    if (transport_.is_open()) {
        transport_.send_text(outbound::end_of_session());
    }
    capture_.stop();
    transport_.close();
    playback_.release_output();

    lifetime_->advance();
    state_ = ConversationState{};
    torn_down_ = true;
    LV_LOG_INFO("Session", "Session torn down");
}

// =============================================================================
// Internals
// =============================================================================

bool VoiceSession::send_control(const std::string& payload, const char* what) {
    if (torn_down_) return false;
    if (!transport_.send_text(payload)) {
        Error error = make_error(ErrorKind::Transport, std::string("Not connected; ") + what +
                                                           " not sent");
        LV_LOG_WARNING("Session", "%s", error.message.c_str());
        if (deps_.listener) deps_.listener->on_error(error);
        return false;
    }
    LV_LOG_DEBUG("Session", "Sent %s", what);
    return true;
}

void VoiceSession::handle_frame(AudioFrame&& frame) {
    transmitter_.relay(frame);

    if (deps_.listener) {
        deps_.listener->on_level(frame.level);
    }

    if (config_.debug_log_interval_frames > 0 &&
        ++frames_since_debug_log_ >= config_.debug_log_interval_frames) {
        frames_since_debug_log_ = 0;
        char message[160];
        snprintf(message, sizeof(message), "Mic RMS: %.4f (frame %llu, sent %llu, dropped %llu)",
                 frame.level, static_cast<unsigned long long>(frame.sequence),
                 static_cast<unsigned long long>(transmitter_.frames_sent()),
                 static_cast<unsigned long long>(transmitter_.frames_dropped()));
        transport_.send_text(outbound::debug_log(message));
    }
}

VoiceSession::Snapshot VoiceSession::snapshot() const {
    return Snapshot{state_.connection_status,
                    state_.phase,
                    state_.utterance_log.size(),
                    state_.current_partial_text,
                    speakable_text(state_.current_assistant_buffer),
                    state_.structured_fields,
                    state_.last_status};
}

void VoiceSession::dispatch(const Event& event) {
    if (torn_down_) return;

    if (dispatching_) {
        // Re-entrant event: run it after the current one completes
        std::weak_ptr<Generation> weak = lifetime_;
        Generation::Value life = lifetime_->current();
        loop_.post([this, weak, life, event]() {
            auto alive = weak.lock();
            if (!alive || !alive->is_current(life)) return;
            dispatch(event);
        });
        return;
    }

    Snapshot before = snapshot();
    dispatching_ = true;

    LV_LOG_TRACE("Session", "Event %s%s%s", event_kind_name(event.kind),
                 event.kind == Event::Kind::Inbound ? " " : "",
                 event.kind == Event::Kind::Inbound ? event.message.type_name.c_str() : "");

    Effects effects = reduce(state_, event);
    for (const Effect& effect : effects) {
        apply(effect);
    }

    dispatching_ = false;
    notify_changes(before, event.kind == Event::Kind::NewChat);
}

void VoiceSession::apply(const Effect& effect) {
    LV_LOG_TRACE("Session", "Effect %s", effect_kind_name(effect.kind));

    switch (effect.kind) {
        case Effect::Kind::EnqueueAudio:
            playback_.enqueue(effect.payload);
            break;

        case Effect::Kind::FlushPlayback:
            playback_.flush();
            break;

        case Effect::Kind::StopCapture:
            capture_.stop();
            break;

        case Effect::Kind::SendInteractionEnd:
            if (!transport_.send_text(outbound::interaction_end())) {
                LV_LOG_WARNING("Session", "interaction_end not sent; socket not open");
            }
            break;

        case Effect::Kind::ShowEligibility:
            LV_LOG_INFO("Session", "Eligibility result: %s",
                        effect.eligibility.eligibility_status.c_str());
            if (deps_.eligibility_view) {
                deps_.eligibility_view->show_eligibility(effect.eligibility);
            }
            break;

        case Effect::Kind::StartVerification:
            LV_LOG_INFO("Session", "Document verification for application %s",
                        effect.verification.application_id.value_or("").c_str());
            if (deps_.verification_flow) {
                deps_.verification_flow->start_verification(effect.verification);
            }
            break;

        case Effect::Kind::RequireVerificationAction:
            LV_LOG_INFO("Session", "Document verification awaiting user action");
            if (deps_.verification_flow) {
                deps_.verification_flow->verification_action_required(effect.verification);
            }
            break;

        case Effect::Kind::SurfaceError:
            LV_LOG_ERROR("Session", "%s", effect.error.to_string().c_str());
            if (deps_.listener) {
                deps_.listener->on_error(effect.error);
            }
            break;
    }
}

void VoiceSession::notify_changes(const Snapshot& before, bool was_reset) {
    SessionListener* listener = deps_.listener;
    if (!listener) return;

    if (was_reset) {
        listener->on_conversation_reset();
    }
    if (state_.connection_status != before.connection_status) {
        listener->on_connection_changed(state_.connection_status);
    }
    if (state_.phase != before.phase) {
        listener->on_phase_changed(state_.phase);
    }

    size_t first_new = state_.utterance_log.size() >= before.log_size && !was_reset
                           ? before.log_size
                           : 0;
    for (size_t i = first_new; i < state_.utterance_log.size(); ++i) {
        listener->on_utterance(state_.utterance_log[i]);
    }

    if (state_.current_partial_text != before.partial_text) {
        listener->on_partial_text(state_.current_partial_text);
    }
    std::string speakable = speakable_text(state_.current_assistant_buffer);
    if (speakable != before.speakable) {
        listener->on_assistant_text(speakable);
    }
    if (state_.structured_fields != before.structured_fields) {
        listener->on_structured_fields(state_.structured_fields);
    }
    if (state_.last_status != before.last_status) {
        listener->on_server_status(state_.last_status);
    }
}

}  // namespace loanvoice
