/**
 * @file capture_graph.h
 * @brief LoanVoice - Microphone capture graph
 *
 * source (CaptureDevice) -> gain (fixed boost, saturating) -> frame sink,
 * with a parallel analyzer tap that reports the normalized RMS of the
 * boosted signal.
 *
 * Samples are accumulated on the device thread into fixed-size frames
 * (2048 samples = 128 ms at 16 kHz by default). Each completed frame is
 * posted to the event loop tagged with the graph's generation; frames from
 * a capture that has since been stopped are dropped there.
 */

#ifndef LOANVOICE_AUDIO_CAPTURE_GRAPH_H
#define LOANVOICE_AUDIO_CAPTURE_GRAPH_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "loanvoice/audio/audio_frame.h"
#include "loanvoice/audio/capture_device.h"
#include "loanvoice/core/error.h"
#include "loanvoice/core/generation.h"

namespace loanvoice {

class EventLoop;

struct CaptureGraphConfig {
    CaptureDeviceConfig device = CaptureDeviceConfig::defaults();
    float gain = 5.0f;
    uint32_t frame_samples = 2048;
    EncodingMode encoding = EncodingMode::Pcm16le;

    // Frame window in milliseconds at the configured device rate
    uint32_t frame_ms() const {
        return device.sample_rate ? frame_samples * 1000 / device.sample_rate : 0;
    }
};

class CaptureGraph {
public:
    // Both run on the event loop thread
    using FrameCallback = std::function<void(AudioFrame&& frame)>;
    using FailureCallback = std::function<void(const Error& error)>;

    CaptureGraph(EventLoop& loop, CaptureDeviceFactory factory,
                 const CaptureGraphConfig& config = CaptureGraphConfig{});
    ~CaptureGraph();

    CaptureGraph(const CaptureGraph&) = delete;
    CaptureGraph& operator=(const CaptureGraph&) = delete;

    void set_frame_callback(FrameCallback callback) { on_frame_ = std::move(callback); }
    void set_failure_callback(FailureCallback callback) { on_failure_ = std::move(callback); }

    /**
     * @brief Acquire the microphone and begin emitting frames.
     * @return false with a Permission or Device error in last_error()
     */
    bool start();

    // Tear down the graph and release the device. Idempotent.
    void stop();

    bool is_running() const { return device_ != nullptr; }

    // Latest analyzer reading (0.0-1.0)
    float level() const { return level_; }

    uint64_t frames_emitted() const { return frames_emitted_; }

    const CaptureGraphConfig& config() const { return config_; }
    const Error& last_error() const { return last_error_; }

private:
    // Device thread
    void on_samples(const int16_t* samples, size_t num_samples, Generation::Value gen);
    void emit_frame(Generation::Value gen);

    // Loop thread
    void handle_device_failure(const Error& error);

    EventLoop& loop_;
    CaptureDeviceFactory factory_;
    CaptureGraphConfig config_;

    std::unique_ptr<CaptureDevice> device_;
    std::shared_ptr<Generation> generation_ = std::make_shared<Generation>();

    // Touched only by the device thread while running
    std::vector<int16_t> accumulator_;
    uint32_t device_rate_ = 0;
    std::atomic<uint64_t> next_sequence_{0};

    FrameCallback on_frame_;
    FailureCallback on_failure_;
    float level_ = 0.0f;
    uint64_t frames_emitted_ = 0;
    Error last_error_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_AUDIO_CAPTURE_GRAPH_H
