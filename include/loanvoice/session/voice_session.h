/**
 * @file voice_session.h
 * @brief LoanVoice - One voice conversation and everything it owns
 *
 * A VoiceSession binds the transport, capture graph, frame transmitter,
 * playback queue and conversation state to one event loop. All public
 * methods must be called on the loop thread. Every state change goes
 * through the dispatcher; the session only performs the resulting effects
 * and reports them to its listener.
 */

#ifndef LOANVOICE_SESSION_VOICE_SESSION_H
#define LOANVOICE_SESSION_VOICE_SESSION_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "loanvoice/audio/audio_output.h"
#include "loanvoice/audio/capture_graph.h"
#include "loanvoice/conversation/conversation_state.h"
#include "loanvoice/conversation/dispatcher.h"
#include "loanvoice/network/frame_transmitter.h"
#include "loanvoice/network/transport_session.h"
#include "loanvoice/playback/playback_queue.h"
#include "loanvoice/session/collaborators.h"

namespace loanvoice {

class EventLoop;

// =============================================================================
// Listener
// =============================================================================

// All methods run on the loop thread; default implementations do nothing.
class SessionListener {
public:
    virtual ~SessionListener() = default;

    virtual void on_connection_changed(ConnectionStatus status) { (void)status; }
    virtual void on_phase_changed(CallPhase phase) { (void)phase; }
    virtual void on_utterance(const Utterance& utterance) { (void)utterance; }
    virtual void on_partial_text(const std::string& text) { (void)text; }
    // Speakable part of the pending assistant buffer
    virtual void on_assistant_text(const std::string& text) { (void)text; }
    virtual void on_structured_fields(const Json& fields) { (void)fields; }
    virtual void on_server_status(const std::string& status) { (void)status; }
    virtual void on_level(float level) { (void)level; }
    virtual void on_error(const Error& error) { (void)error; }
    virtual void on_conversation_reset() {}
};

// =============================================================================
// Configuration
// =============================================================================

struct SessionConfig {
    std::string server_url = "ws://localhost:8000/api/voice/stream";
    CaptureGraphConfig capture;
    // Send a debug_log with the mic level every N frames (0 = never)
    uint32_t debug_log_interval_frames = 40;
};

struct SessionDependencies {
    CaptureDeviceFactory capture_factory;
    AudioOutputFactory output_factory;
    WebSocketFactory socket_factory;

    // Not owned; may be null
    TokenProvider* token_provider = nullptr;
    EligibilityView* eligibility_view = nullptr;
    VerificationFlow* verification_flow = nullptr;
    SessionListener* listener = nullptr;
};

// =============================================================================
// VoiceSession
// =============================================================================

class VoiceSession {
public:
    VoiceSession(EventLoop& loop, const SessionConfig& config, SessionDependencies deps);
    ~VoiceSession();

    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    // Open the voice channel; `on_ready` runs once it is open
    void connect(std::function<void()> on_ready = {});

    /**
     * @brief Start capturing and streaming. Requires an open connection.
     * @return false on Permission/Device errors (also reported to the listener)
     */
    bool start_call();

    // Stop capturing and tell the server the interaction ended
    void end_call();

    // Recording -> end; connected -> start; otherwise connect, then start
    void toggle_call();

    bool send_text(const std::string& text);
    bool notify_document_uploaded(const Json& data, const std::string& doc_type = "");
    bool notify_document_verified(const Json& data, const std::string& doc_type = "");
    bool notify_verification_completed();

    // Explicit user action when the server supplied no application id
    void proceed_to_verification(const std::string& application_id);

    void new_chat();

    // Release everything. Idempotent; the session is unusable afterwards.
    void teardown();

    const ConversationState& state() const { return state_; }
    const TransportSession& transport() const { return transport_; }
    const CaptureGraph& capture() const { return capture_; }
    const PlaybackQueue& playback() const { return playback_; }
    const FrameTransmitter& transmitter() const { return transmitter_; }
    bool is_torn_down() const { return torn_down_; }

private:
    void dispatch(const Event& event);

    // Listener-visible parts of the state before an event
    struct Snapshot {
        ConnectionStatus connection_status;
        CallPhase phase;
        size_t log_size;
        std::string partial_text;
        std::string speakable;
        Json structured_fields;
        std::string last_status;
    };
    Snapshot snapshot() const;
    void notify_changes(const Snapshot& before, bool was_reset);

    void apply(const Effect& effect);
    void handle_frame(AudioFrame&& frame);
    bool send_control(const std::string& payload, const char* what);

    EventLoop& loop_;
    SessionConfig config_;
    SessionDependencies deps_;

    TransportSession transport_;
    CaptureGraph capture_;
    FrameTransmitter transmitter_;
    PlaybackQueue playback_;
    ConversationState state_;

    // Guards deferred tasks against a destroyed or torn-down session
    std::shared_ptr<Generation> lifetime_ = std::make_shared<Generation>();

    uint32_t frames_since_debug_log_ = 0;
    bool dispatching_ = false;
    bool torn_down_ = false;
};

}  // namespace loanvoice

#endif  // LOANVOICE_SESSION_VOICE_SESSION_H
