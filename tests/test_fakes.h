/**
 * @file test_fakes.h
 * @brief In-memory capture device, audio output and WebSocket for tests
 *
 * Each fake shares a state object with the test so the test can drive the
 * device (push samples, complete playback, deliver socket frames) after the
 * code under test has taken ownership of the fake through its factory.
 */

#ifndef LOANVOICE_TESTS_TEST_FAKES_H
#define LOANVOICE_TESTS_TEST_FAKES_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "loanvoice/audio/audio_output.h"
#include "loanvoice/audio/capture_device.h"
#include "loanvoice/audio/wav_codec.h"
#include "loanvoice/network/websocket_transport.h"
#include "loanvoice/protocol/base64.h"

namespace loanvoice {
namespace testing {

// =============================================================================
// Capture device
// =============================================================================

struct FakeCaptureState {
    Error open_error;  ///< Returned from open() when set
    uint32_t sample_rate = 16000;
    CaptureDeviceConfig last_config;
    CaptureSamplesCallback on_samples;
    CaptureErrorCallback on_error;
    int opens = 0;
    int closes = 0;
    bool open = false;

    // Deliver samples as the device thread would
    void push(const std::vector<int16_t>& samples) {
        if (open && on_samples) on_samples(samples.data(), samples.size());
    }
    void fail(const Error& error) {
        if (open && on_error) on_error(error);
    }
};

class FakeCaptureDevice : public CaptureDevice {
public:
    explicit FakeCaptureDevice(std::shared_ptr<FakeCaptureState> state) : state_(std::move(state)) {}
    ~FakeCaptureDevice() override { close(); }

    bool open(const CaptureDeviceConfig& config) override {
        ++state_->opens;
        state_->last_config = config;
        if (state_->open_error) {
            last_error_ = state_->open_error;
            return false;
        }
        state_->open = true;
        return true;
    }

    bool start(CaptureSamplesCallback on_samples, CaptureErrorCallback on_error) override {
        if (!state_->open) return false;
        state_->on_samples = std::move(on_samples);
        state_->on_error = std::move(on_error);
        return true;
    }

    void close() override {
        if (closed_) return;
        closed_ = true;
        ++state_->closes;
        state_->open = false;
        state_->on_samples = nullptr;
        state_->on_error = nullptr;
    }

    bool is_open() const override { return state_->open && !closed_; }
    uint32_t sample_rate() const override { return state_->sample_rate; }
    const Error& last_error() const override { return last_error_; }

private:
    std::shared_ptr<FakeCaptureState> state_;
    Error last_error_;
    bool closed_ = false;
};

inline CaptureDeviceFactory fake_capture_factory(std::shared_ptr<FakeCaptureState> state) {
    return [state]() -> std::unique_ptr<CaptureDevice> {
        return std::make_unique<FakeCaptureDevice>(state);
    };
}

// =============================================================================
// Audio output
// =============================================================================

struct FakeOutputState {
    bool fail_open = false;
    int created = 0;
    int opens = 0;
    int closes = 0;
    int stops = 0;
    // When set, stop_current() only requests the halt, like the ALSA writer
    // mid-period; complete(false) then acknowledges it
    bool async_stop = false;
    bool stop_requested = false;
    std::vector<PcmAudio> played;
    AudioOutput::CompletionCallback pending;

    bool busy() const { return static_cast<bool>(pending); }

    // Finish the active item as the output thread would
    void complete(bool completed = true) {
        if (!pending) return;
        auto callback = std::move(pending);
        pending = nullptr;
        stop_requested = false;
        callback(completed);
    }
};

class FakeAudioOutput : public AudioOutput {
public:
    explicit FakeAudioOutput(std::shared_ptr<FakeOutputState> state) : state_(std::move(state)) {
        ++state_->created;
    }

    bool open() override {
        if (open_) return true;
        ++state_->opens;
        if (state_->fail_open) {
            last_error_ = make_error(ErrorKind::Device, "No speaker");
            return false;
        }
        open_ = true;
        return true;
    }

    bool play(PcmAudio audio, CompletionCallback on_complete) override {
        if (!open_ || state_->pending) return false;
        state_->played.push_back(std::move(audio));
        state_->pending = std::move(on_complete);
        return true;
    }

    void stop_current() override {
        ++state_->stops;
        if (state_->async_stop) {
            state_->stop_requested = state_->busy();
            return;
        }
        state_->complete(false);
    }

    bool is_busy() const override { return state_->busy(); }

    void close() override {
        if (!open_) return;
        open_ = false;
        ++state_->closes;
        state_->pending = nullptr;
    }

    bool is_open() const override { return open_; }
    const Error& last_error() const override { return last_error_; }

private:
    std::shared_ptr<FakeOutputState> state_;
    Error last_error_;
    bool open_ = false;
};

inline AudioOutputFactory fake_output_factory(std::shared_ptr<FakeOutputState> state) {
    return [state]() -> std::unique_ptr<AudioOutput> {
        return std::make_unique<FakeAudioOutput>(state);
    };
}

// Base64 WAV payload as carried by audio_chunk
inline std::string make_audio_payload(size_t num_samples = 240, uint32_t sample_rate = 24000,
                                      int16_t value = 1000) {
    std::vector<int16_t> samples(num_samples, value);
    return base64_encode(wav_encode(samples.data(), samples.size(), sample_rate));
}

// =============================================================================
// WebSocket
// =============================================================================

// One connect() call
struct FakeConnection {
    std::string url;
    WebSocketCallbacks callbacks;
    std::vector<std::string> sent_text;
    std::vector<std::vector<uint8_t>> sent_binary;
    bool closed = false;

    void open() {
        if (callbacks.on_open) callbacks.on_open();
    }
    void receive(const std::string& text) {
        if (callbacks.on_text) callbacks.on_text(text);
    }
    void remote_close(int code = 1000, const std::string& reason = "") {
        if (callbacks.on_close) callbacks.on_close(code, reason);
    }
    void fail(const std::string& message = "Connection refused") {
        if (callbacks.on_error) callbacks.on_error(make_error(ErrorKind::Transport, message));
    }
};

struct FakeSocketState {
    std::vector<std::shared_ptr<FakeConnection>> connections;

    std::shared_ptr<FakeConnection> last() const {
        return connections.empty() ? nullptr : connections.back();
    }
};

class FakeWebSocket : public WebSocketTransport {
public:
    explicit FakeWebSocket(std::shared_ptr<FakeSocketState> state) : state_(std::move(state)) {}
    ~FakeWebSocket() override { close(); }

    void connect(const std::string& url, WebSocketCallbacks callbacks) override {
        connection_ = std::make_shared<FakeConnection>();
        connection_->url = url;
        connection_->callbacks = std::move(callbacks);
        state_->connections.push_back(connection_);
    }

    bool send_text(const std::string& payload) override {
        if (!connection_ || connection_->closed) return false;
        connection_->sent_text.push_back(payload);
        return true;
    }

    bool send_binary(const uint8_t* data, size_t len) override {
        if (!connection_ || connection_->closed) return false;
        connection_->sent_binary.emplace_back(data, data + len);
        return true;
    }

    void close() override {
        if (connection_) connection_->closed = true;
    }

private:
    std::shared_ptr<FakeSocketState> state_;
    std::shared_ptr<FakeConnection> connection_;
};

inline WebSocketFactory fake_socket_factory(std::shared_ptr<FakeSocketState> state) {
    return [state]() -> std::unique_ptr<WebSocketTransport> {
        return std::make_unique<FakeWebSocket>(state);
    };
}

}  // namespace testing
}  // namespace loanvoice

#endif  // LOANVOICE_TESTS_TEST_FAKES_H
