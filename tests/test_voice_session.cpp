/**
 * @file test_voice_session.cpp
 * @brief End-to-end tests for a voice session over fake devices and socket
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "loanvoice/core/event_loop.h"
#include "loanvoice/session/voice_session.h"
#include "test_fakes.h"

using namespace loanvoice;
using namespace loanvoice::testing;

namespace {

class RecordingListener : public SessionListener {
public:
    void on_connection_changed(ConnectionStatus status) override { statuses.push_back(status); }
    void on_phase_changed(CallPhase phase) override { phases.push_back(phase); }
    void on_utterance(const Utterance& utterance) override { utterances.push_back(utterance); }
    void on_partial_text(const std::string& text) override { partials.push_back(text); }
    void on_assistant_text(const std::string& text) override { assistant_text = text; }
    void on_structured_fields(const Json& fields) override { structured = fields; }
    void on_level(float level) override { levels.push_back(level); }
    void on_error(const Error& error) override { errors.push_back(error); }
    void on_conversation_reset() override { ++resets; }

    std::vector<ConnectionStatus> statuses;
    std::vector<CallPhase> phases;
    std::vector<Utterance> utterances;
    std::vector<std::string> partials;
    std::string assistant_text;
    Json structured;
    std::vector<float> levels;
    std::vector<Error> errors;
    int resets = 0;
};

class RecordingEligibilityView : public EligibilityView {
public:
    void show_eligibility(const EligibilityResult& result) override { results.push_back(result); }
    std::vector<EligibilityResult> results;
};

class RecordingVerificationFlow : public VerificationFlow {
public:
    void start_verification(const VerificationHandoff& handoff) override {
        started.push_back(handoff);
    }
    void verification_action_required(const VerificationHandoff& handoff) override {
        awaiting.push_back(handoff);
    }
    std::vector<VerificationHandoff> started;
    std::vector<VerificationHandoff> awaiting;
};

std::string inbound(const std::string& type, const Json& data = Json()) {
    Json msg = {{"type", type}};
    if (!data.is_null()) msg["data"] = data;
    return msg.dump();
}

std::vector<std::string> sent_types(const FakeConnection& conn) {
    std::vector<std::string> types;
    for (const auto& text : conn.sent_text) {
        types.push_back(Json::parse(text)["type"].get<std::string>());
    }
    return types;
}

bool was_sent(const FakeConnection& conn, const std::string& type) {
    for (const auto& t : sent_types(conn)) {
        if (t == type) return true;
    }
    return false;
}

class VoiceSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.capture.frame_samples = 1024;
        config.debug_log_interval_frames = 0;
        make_session();
    }

    void make_session() {
        SessionDependencies deps;
        deps.capture_factory = fake_capture_factory(mic);
        deps.output_factory = fake_output_factory(speaker);
        deps.socket_factory = fake_socket_factory(sockets);
        deps.token_provider = &tokens;
        deps.eligibility_view = &eligibility;
        deps.verification_flow = &verification;
        deps.listener = &listener;
        session = std::make_unique<VoiceSession>(loop, config, std::move(deps));
    }

    // Connect and let the fake socket open
    std::shared_ptr<FakeConnection> connect() {
        session->connect();
        auto conn = sockets->last();
        conn->open();
        loop.run_pending();
        return conn;
    }

    std::shared_ptr<FakeConnection> connect_and_call() {
        auto conn = connect();
        EXPECT_TRUE(session->start_call());
        return conn;
    }

    void receive(FakeConnection& conn, const std::string& type, const Json& data = Json()) {
        conn.receive(inbound(type, data));
        loop.run_pending();
    }

    EventLoop loop;
    SessionConfig config;
    std::shared_ptr<FakeCaptureState> mic = std::make_shared<FakeCaptureState>();
    std::shared_ptr<FakeOutputState> speaker = std::make_shared<FakeOutputState>();
    std::shared_ptr<FakeSocketState> sockets = std::make_shared<FakeSocketState>();
    StaticTokenProvider tokens{"secret token"};
    RecordingListener listener;
    RecordingEligibilityView eligibility;
    RecordingVerificationFlow verification;
    std::unique_ptr<VoiceSession> session;
};

}  // namespace

// =============================================================================
// CONNECT AND CALL
// =============================================================================

TEST_F(VoiceSessionTest, ConnectUsesTokenAndReportsStatus) {
    auto conn = connect();

    EXPECT_EQ(conn->url, config.server_url + "?token=secret%20token");
    EXPECT_EQ(session->state().connection_status, ConnectionStatus::Connected);
    EXPECT_EQ(session->state().phase, CallPhase::ConnectedIdle);
    ASSERT_EQ(listener.statuses.size(), 2u);
    EXPECT_EQ(listener.statuses[0], ConnectionStatus::Connecting);
    EXPECT_EQ(listener.statuses[1], ConnectionStatus::Connected);
}

TEST_F(VoiceSessionTest, StartCallRequiresOpenConnection) {
    EXPECT_FALSE(session->start_call());
    ASSERT_EQ(listener.errors.size(), 1u);
    EXPECT_EQ(listener.errors[0].kind, ErrorKind::Transport);
    EXPECT_EQ(listener.errors[0].message, "Not connected");
    EXPECT_EQ(mic->opens, 0);
}

TEST_F(VoiceSessionTest, CallStreamsMicrophoneFrames) {
    auto conn = connect_and_call();
    EXPECT_TRUE(session->state().recording);
    EXPECT_EQ(session->state().phase, CallPhase::Recording);

    mic->push(std::vector<int16_t>(2048, 100));
    loop.run_pending();

    ASSERT_EQ(conn->sent_binary.size(), 2u);
    EXPECT_EQ(conn->sent_binary[0].size(), 2048u);
    EXPECT_EQ(session->transmitter().frames_sent(), 2u);
    EXPECT_EQ(listener.levels.size(), 2u);
}

TEST_F(VoiceSessionTest, PermissionDeniedLeavesCallIdle) {
    auto conn = connect();
    mic->open_error = make_error(ErrorKind::Permission, "Microphone access denied");

    EXPECT_FALSE(session->start_call());
    EXPECT_FALSE(session->state().recording);
    EXPECT_EQ(session->state().phase, CallPhase::ConnectedIdle);
    ASSERT_EQ(listener.errors.size(), 1u);
    EXPECT_EQ(listener.errors[0].kind, ErrorKind::Permission);
    EXPECT_TRUE(conn->sent_binary.empty());
}

TEST_F(VoiceSessionTest, EndCallSendsInteractionEnd) {
    auto conn = connect_and_call();
    session->end_call();

    EXPECT_FALSE(session->state().recording);
    EXPECT_FALSE(session->capture().is_running());
    EXPECT_EQ(mic->closes, 1);
    EXPECT_TRUE(was_sent(*conn, "interaction_end"));
    EXPECT_TRUE(session->transport().is_open());
}

TEST_F(VoiceSessionTest, ToggleConnectsThenStartsCall) {
    session->toggle_call();
    EXPECT_FALSE(session->state().recording);

    sockets->last()->open();
    loop.run_pending();
    EXPECT_TRUE(session->state().recording);

    session->toggle_call();
    EXPECT_FALSE(session->state().recording);
    EXPECT_TRUE(session->transport().is_open());
}

TEST_F(VoiceSessionTest, SocketCloseDuringCallReleasesCapture) {
    auto conn = connect_and_call();
    ASSERT_TRUE(mic->open);

    conn->remote_close(1006);
    loop.run_pending();

    EXPECT_FALSE(session->state().recording);
    EXPECT_FALSE(mic->open);
    EXPECT_FALSE(session->capture().is_running());
    EXPECT_EQ(session->state().connection_status, ConnectionStatus::Disconnected);
    EXPECT_EQ(session->state().phase, CallPhase::Disconnected);
    EXPECT_FALSE(was_sent(*conn, "interaction_end"));
}

TEST_F(VoiceSessionTest, DebugLogEveryNthFrame) {
    config.debug_log_interval_frames = 2;
    make_session();
    auto conn = connect_and_call();

    mic->push(std::vector<int16_t>(1024 * 5, 300));
    loop.run_pending();

    std::vector<std::string> debug_logs;
    for (const auto& text : conn->sent_text) {
        Json msg = Json::parse(text);
        if (msg["type"] == "debug_log") debug_logs.push_back(msg["message"].get<std::string>());
    }
    ASSERT_EQ(debug_logs.size(), 2u);
    EXPECT_EQ(debug_logs[0].rfind("Mic RMS: ", 0), 0u);
}

// =============================================================================
// CONVERSATION
// =============================================================================

TEST_F(VoiceSessionTest, TranscriptsReachListener) {
    auto conn = connect_and_call();
    receive(*conn, "partial_transcript", "I need");
    receive(*conn, "final_transcript", "I need a loan");
    receive(*conn, "ai_token", "How much|||{\"intent\":\"amount\"}");

    ASSERT_EQ(listener.utterances.size(), 1u);
    EXPECT_EQ(listener.utterances[0].text, "I need a loan");
    EXPECT_EQ(listener.partials.front(), "I need");
    EXPECT_EQ(listener.partials.back(), "");
    EXPECT_EQ(listener.assistant_text, "How much");
}

TEST_F(VoiceSessionTest, AssistantAudioPlaysAndGoesIdle) {
    auto conn = connect_and_call();
    receive(*conn, "audio_chunk", make_audio_payload(480));

    ASSERT_EQ(speaker->played.size(), 1u);
    EXPECT_TRUE(session->state().assistant_speaking);

    speaker->complete();
    loop.run_pending();
    EXPECT_FALSE(session->state().assistant_speaking);
    EXPECT_EQ(session->playback().stats().played, 1u);
}

TEST_F(VoiceSessionTest, InterruptBeforePlaybackStartsPlaysNothing) {
    auto conn = connect_and_call();
    conn->receive(inbound("audio_chunk", make_audio_payload()));
    conn->receive(inbound("audio_chunk", make_audio_payload()));
    conn->receive(inbound("interrupt"));
    loop.run_pending();

    EXPECT_TRUE(speaker->played.empty());
    EXPECT_EQ(session->playback().size(), 0u);
    EXPECT_TRUE(session->state().recording);
}

TEST_F(VoiceSessionTest, BargeInHaltsPlayback) {
    auto conn = connect_and_call();
    receive(*conn, "audio_chunk", make_audio_payload());
    receive(*conn, "audio_chunk", make_audio_payload());
    ASSERT_TRUE(session->playback().is_playing());

    receive(*conn, "partial_transcript", "wait");
    EXPECT_FALSE(session->playback().is_playing());
    EXPECT_EQ(session->playback().size(), 0u);
    EXPECT_EQ(speaker->stops, 1);
    EXPECT_EQ(session->state().phase, CallPhase::RecordingPlaybackInterrupted);
    EXPECT_TRUE(mic->open);
}

TEST_F(VoiceSessionTest, ReplyAfterBargeInPlaysOnceHaltLands) {
    speaker->async_stop = true;
    auto conn = connect_and_call();
    receive(*conn, "audio_chunk", make_audio_payload(100));
    ASSERT_EQ(speaker->played.size(), 1u);

    receive(*conn, "interrupt");
    receive(*conn, "audio_chunk", make_audio_payload(60));
    EXPECT_EQ(speaker->stops, 1);
    EXPECT_EQ(speaker->played.size(), 1u);

    speaker->complete(false);
    loop.run_pending();

    ASSERT_EQ(speaker->played.size(), 2u);
    EXPECT_EQ(speaker->played[1].samples.size(), 60u);
    EXPECT_EQ(session->playback().stats().skipped, 0u);
    EXPECT_TRUE(session->state().assistant_speaking);
    EXPECT_EQ(session->state().phase, CallPhase::Recording);
}

TEST_F(VoiceSessionTest, StructuredFieldsReachListener) {
    auto conn = connect();
    receive(*conn, "structured_update", Json{{"name", "Anil"}});
    receive(*conn, "structured_update", Json{{"income", 5000}});
    EXPECT_EQ(listener.structured, (Json{{"name", "Anil"}, {"income", 5000}}));
}

TEST_F(VoiceSessionTest, EligibilityResultEndsCallAndShowsView) {
    auto conn = connect_and_call();
    receive(*conn, "eligibility_result",
            Json{{"eligibility_status", "eligible"}, {"credit_tier", "Excellent"}});

    ASSERT_EQ(eligibility.results.size(), 1u);
    EXPECT_EQ(eligibility.results[0].credit_tier, "Excellent");
    EXPECT_FALSE(session->state().recording);
    EXPECT_FALSE(mic->open);
    EXPECT_TRUE(was_sent(*conn, "interaction_end"));
    EXPECT_TRUE(session->state().frozen);

    session->new_chat();
    EXPECT_FALSE(session->state().frozen);
    EXPECT_EQ(listener.resets, 1);
}

TEST_F(VoiceSessionTest, CallRefusedUntilNewChatAfterResult) {
    auto conn = connect_and_call();
    receive(*conn, "eligibility_result", Json{{"eligibility_status", "eligible"}});
    int opens = mic->opens;

    EXPECT_FALSE(session->start_call());
    EXPECT_FALSE(session->state().recording);
    EXPECT_EQ(mic->opens, opens);
    ASSERT_FALSE(listener.errors.empty());
    EXPECT_EQ(listener.errors.back().kind, ErrorKind::Session);

    session->new_chat();
    EXPECT_TRUE(session->start_call());
    EXPECT_TRUE(session->state().recording);
}

TEST_F(VoiceSessionTest, VerificationHandoff) {
    auto conn = connect_and_call();
    receive(*conn, "document_verification_required", Json{{"message", "Upload PAN"}});

    ASSERT_EQ(verification.awaiting.size(), 1u);
    EXPECT_TRUE(verification.started.empty());
    EXPECT_FALSE(session->state().recording);

    session->proceed_to_verification("APP-9");
    ASSERT_EQ(verification.started.size(), 1u);
    EXPECT_EQ(verification.started[0].application_id.value_or(""), "APP-9");
}

TEST_F(VoiceSessionTest, ServerErrorReachesListener) {
    auto conn = connect();
    receive(*conn, "error", "Session expired");
    ASSERT_EQ(listener.errors.size(), 1u);
    EXPECT_EQ(listener.errors[0].kind, ErrorKind::Server);
    EXPECT_EQ(listener.errors[0].message, "Session expired");
}

// =============================================================================
// OUTBOUND CONTROL
// =============================================================================

TEST_F(VoiceSessionTest, ControlMessagesRequireConnection) {
    EXPECT_FALSE(session->send_text("hello"));
    ASSERT_EQ(listener.errors.size(), 1u);
    EXPECT_EQ(listener.errors[0].kind, ErrorKind::Transport);

    auto conn = connect();
    EXPECT_FALSE(session->send_text("   "));
    EXPECT_TRUE(session->send_text("My income is 5000"));
    EXPECT_TRUE(session->notify_document_uploaded(Json{{"file", "pan.pdf"}}, "pan"));
    EXPECT_TRUE(session->notify_document_verified(Json::object()));
    EXPECT_TRUE(session->notify_verification_completed());

    EXPECT_EQ(sent_types(*conn), (std::vector<std::string>{"text_input", "document_uploaded",
                                                            "document_verified",
                                                            "verification_completed"}));
    // Typed text is echoed back by the server, not committed locally
    EXPECT_TRUE(session->state().utterance_log.empty());
}

// =============================================================================
// TEARDOWN
// =============================================================================

TEST_F(VoiceSessionTest, TeardownReleasesEverything) {
    auto conn = connect_and_call();
    receive(*conn, "audio_chunk", make_audio_payload());
    ASSERT_TRUE(session->playback().has_output());

    session->teardown();

    EXPECT_EQ(sent_types(*conn).back(), "end_of_session");
    EXPECT_TRUE(conn->closed);
    EXPECT_FALSE(mic->open);
    EXPECT_EQ(speaker->closes, 1);
    EXPECT_TRUE(session->is_torn_down());
    EXPECT_FALSE(session->start_call());

    // Late socket traffic is ignored
    conn->receive(inbound("final_transcript", "too late"));
    loop.run_pending();
    EXPECT_TRUE(session->state().utterance_log.empty());

    session->teardown();
}

TEST_F(VoiceSessionTest, DestroyingSessionWithQueuedWorkIsSafe) {
    auto conn = connect_and_call();
    mic->push(std::vector<int16_t>(1024, 1));
    conn->receive(inbound("status", "thinking"));
    session.reset();

    EXPECT_NO_THROW(loop.run_pending());
    EXPECT_FALSE(mic->open);
}

// =============================================================================
// TOKEN STORE
// =============================================================================

TEST(SessionStoreTokenProvider, ReadsJsonOrBareToken) {
    std::string path = ::testing::TempDir() + "loanvoice_token_test.json";
    {
        std::ofstream out(path);
        out << R"({"access_token": "abc123"})";
    }
    SessionStoreTokenProvider provider(path, "");
    EXPECT_EQ(provider.token(), "abc123");

    {
        std::ofstream out(path);
        out << "  bare-token\n";
    }
    EXPECT_EQ(provider.token(), "bare-token");
    std::remove(path.c_str());

    EXPECT_EQ(provider.token(), "");
}
