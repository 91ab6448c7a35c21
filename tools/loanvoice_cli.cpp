// =============================================================================
// LoanVoice - Command Line Client
// =============================================================================
// Talks to the loan assistant over the voice stream: microphone audio goes
// up as binary frames, transcripts and synthesized speech come back.
//
// Usage: ./loanvoice-cli [options]    (see --help)
//
// Controls:
//   /call, /new, /upload <type>, ... on stdin (see --help)
//   Ctrl+C                   Exit the application
// =============================================================================

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "loanvoice/audio/alsa_audio_output.h"
#include "loanvoice/audio/alsa_capture_device.h"
#include "loanvoice/config/client_config.h"
#include "loanvoice/conversation/structured_data.h"
#include "loanvoice/core/event_loop.h"
#include "loanvoice/core/logger.h"
#include "loanvoice/network/notification_channel.h"
#include "loanvoice/network/websocket_client.h"
#include "loanvoice/session/voice_session.h"

using namespace loanvoice;

// =============================================================================
// Global State
// =============================================================================

std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

namespace {

void list_audio_devices() {
    std::cout << "Input devices (microphones):\n";
    for (const auto& dev : AlsaCaptureDevice::list_devices()) {
        std::cout << "  " << dev << "\n";
    }

    std::cout << "\nOutput devices (speakers):\n";
    for (const auto& dev : AlsaAudioOutput::list_devices()) {
        std::cout << "  " << dev << "\n";
    }
    std::cout << std::endl;
}

// =============================================================================
// Console views
// =============================================================================

class ConsoleListener : public SessionListener {
public:
    void on_connection_changed(ConnectionStatus status) override {
        std::cout << "[connection] " << connection_status_name(status) << std::endl;
    }

    void on_phase_changed(CallPhase phase) override {
        std::cout << "[call] " << call_phase_name(phase) << std::endl;
    }

    void on_utterance(const Utterance& utterance) override {
        std::cout << (utterance.role == Role::User ? "You: " : "Assistant: ") << utterance.text
                  << std::endl;
    }

    void on_partial_text(const std::string& text) override {
        if (!text.empty()) {
            std::cout << "  ... " << text << std::endl;
        }
    }

    void on_structured_fields(const Json& fields) override {
        std::cout << "[collected]";
        for (const auto& line : describe_fields(fields)) {
            std::cout << "  " << line;
        }
        std::cout << std::endl;
    }

    void on_server_status(const std::string& status) override {
        std::cout << "[status] " << status << std::endl;
    }

    void on_error(const Error& error) override {
        std::cerr << "ERROR: " << error.to_string() << std::endl;
    }

    void on_conversation_reset() override {
        std::cout << "---- new chat ----" << std::endl;
    }
};

class ConsoleEligibilityView : public EligibilityView {
public:
    void show_eligibility(const EligibilityResult& result) override {
        std::cout << "========================================\n"
                  << "  Eligibility: " << result.eligibility_status << "\n"
                  << "  Score:       " << result.eligibility_score << "\n"
                  << "  Risk:        " << result.risk_level << "\n"
                  << "  Credit tier: " << result.credit_tier << "\n"
                  << "  Confidence:  " << result.confidence << "\n"
                  << "  DTI ratio:   " << result.debt_to_income_ratio << "\n";
        if (result.application_id) {
            std::cout << "  Application: " << *result.application_id << "\n";
        }
        std::cout << "========================================\n"
                  << "Type /new to start another chat." << std::endl;
    }
};

class ConsoleVerificationFlow : public VerificationFlow {
public:
    void start_verification(const VerificationHandoff& handoff) override {
        std::cout << "[verification] Application " << handoff.application_id.value_or("?")
                  << ": upload " << join(handoff) << std::endl;
    }

    void verification_action_required(const VerificationHandoff& handoff) override {
        std::cout << "[verification] Documents needed: " << join(handoff)
                  << "\n  Type /proceed <application id> to continue." << std::endl;
    }

private:
    static std::string join(const VerificationHandoff& handoff) {
        std::string out;
        for (const auto& doc : handoff.required_documents) {
            if (!out.empty()) out += ", ";
            out += doc;
        }
        return out;
    }
};

// =============================================================================
// Stdin commands
// =============================================================================

void handle_command(const std::string& line, VoiceSession& session, EventLoop& loop) {
    std::istringstream in(line);
    std::string command;
    in >> command;
    std::string arg;
    std::getline(in >> std::ws, arg);

    if (command == "/quit" || command == "/exit") {
        g_running = false;
        loop.stop();
    } else if (command == "/call") {
        session.toggle_call();
    } else if (command == "/new") {
        session.new_chat();
    } else if (command == "/upload") {
        Json data;
        data["source"] = "cli";
        session.notify_document_uploaded(data, arg);
    } else if (command == "/verified") {
        Json data;
        data["source"] = "cli";
        session.notify_document_verified(data, arg);
    } else if (command == "/done") {
        session.notify_verification_completed();
    } else if (command == "/proceed") {
        if (arg.empty()) {
            std::cerr << "Usage: /proceed <application id>" << std::endl;
        } else {
            session.proceed_to_verification(arg);
        }
    } else if (!line.empty() && line[0] == '/') {
        std::cerr << "Unknown command: " << command << std::endl;
    } else {
        session.send_text(line);
    }
}

// Reads lines on its own thread and posts them to the loop
void read_stdin(EventLoop& loop, VoiceSession& session) {
    std::string pending;
    char buffer[512];
    while (g_running) {
        struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0) continue;

        ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
        if (n <= 0) {
            // EOF: leave the session running until Ctrl+C
            return;
        }
        pending.append(buffer, static_cast<size_t>(n));

        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (line.empty()) continue;
            loop.post([line, &session, &loop]() { handle_command(line, session, loop); });
        }
    }
}

// Re-arms itself until a signal clears g_running
void watch_shutdown(EventLoop& loop) {
    if (!g_running) {
        loop.stop();
        return;
    }
    loop.post_delayed(std::chrono::milliseconds(100), [&loop]() { watch_shutdown(loop); });
}

}  // namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    ClientConfig config;
    Error error;
    if (!load_client_config(argc, argv, config, error)) {
        std::cerr << "ERROR: " << error.message << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (config.list_devices) {
        list_audio_devices();
        return 0;
    }

    Logger::instance().setMinLevel(config.log_level);

    // Install signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "========================================\n"
              << "    LoanVoice - Loan Assistant\n"
              << "========================================\n"
              << "Server:   " << config.session.server_url << "\n"
              << "Input:    " << config.session.capture.device.device << "\n"
              << "Output:   " << config.playback.device << "\n"
              << "Encoding: " << encoding_mode_name(config.session.capture.encoding) << "\n"
              << "Type /call to talk, or type a message. Ctrl+C to exit.\n"
              << "========================================\n"
              << std::endl;

    EventLoop loop;

    WebSocketClientConfig socket_config;
    socket_config.connect_timeout_ms = config.connect_timeout_ms;
    WebSocketFactory socket_factory = [socket_config]() -> std::unique_ptr<WebSocketTransport> {
        return std::make_unique<WebSocketClient>(socket_config);
    };

    std::unique_ptr<TokenProvider> tokens;
    if (!config.token.empty()) {
        tokens = std::make_unique<StaticTokenProvider>(config.token);
    } else {
        tokens = std::make_unique<SessionStoreTokenProvider>(config.token_file, config.token_env);
    }

    ConsoleListener listener;
    ConsoleEligibilityView eligibility_view;
    ConsoleVerificationFlow verification_flow;

    SessionDependencies deps;
    deps.capture_factory = []() -> std::unique_ptr<CaptureDevice> {
        return std::make_unique<AlsaCaptureDevice>();
    };
    OutputDeviceConfig playback_config = config.playback;
    deps.output_factory = [playback_config]() -> std::unique_ptr<AudioOutput> {
        return std::make_unique<AlsaAudioOutput>(playback_config);
    };
    deps.socket_factory = socket_factory;
    deps.token_provider = tokens.get();
    deps.eligibility_view = &eligibility_view;
    deps.verification_flow = &verification_flow;
    deps.listener = &listener;

    VoiceSession session(loop, config.session, std::move(deps));

    std::unique_ptr<NotificationChannel> notifications;
    if (!config.notification_url.empty()) {
        notifications = std::make_unique<NotificationChannel>(loop, socket_factory,
                                                              config.notification_reconnect);
        notifications->set_callback([](const Notification& notification) {
            std::cout << "[notification] " << notification.type << ": "
                      << payload_text(notification.payload.value("message", Json())) << std::endl;
        });
        notifications->connect(config.notification_url, tokens->token());
    }

    LV_LOG_INFO("CLI", "Connecting to %s", config.session.server_url.c_str());
    bool start_call = config.start_call;
    session.connect([&session, start_call]() {
        if (start_call) {
            session.start_call();
        }
    });

    std::thread stdin_thread(read_stdin, std::ref(loop), std::ref(session));
    watch_shutdown(loop);

    loop.run();

    // =============================================================================
    // Cleanup
    // =============================================================================

    std::cout << "\nStopping..." << std::endl;

    g_running = false;
    if (stdin_thread.joinable()) {
        stdin_thread.join();
    }

    if (notifications) {
        notifications->close();
    }
    session.teardown();

    // Let the socket threads' final posts drain before the loop goes away
    loop.run_pending();

    std::cout << "Goodbye!" << std::endl;
    return 0;
}
