// =============================================================================
// Capture Graph - Implementation
// =============================================================================

#include "loanvoice/audio/capture_graph.h"

#include <algorithm>

#include "loanvoice/audio/audio_processing.h"
#include "loanvoice/core/event_loop.h"
#include "loanvoice/core/logger.h"

namespace loanvoice {

CaptureGraph::CaptureGraph(EventLoop& loop, CaptureDeviceFactory factory,
                           const CaptureGraphConfig& config)
    : loop_(loop), factory_(std::move(factory)), config_(config) {}

CaptureGraph::~CaptureGraph() {
    stop();
}

bool CaptureGraph::start() {
    if (device_) {
        return true;
    }
    last_error_ = Error{};

    if (!factory_) {
        last_error_ = make_error(ErrorKind::Device, "No capture device available");
        return false;
    }

    std::unique_ptr<CaptureDevice> device = factory_();
    if (!device) {
        last_error_ = make_error(ErrorKind::Device, "No capture device available");
        return false;
    }

    if (!device->open(config_.device)) {
        last_error_ = device->last_error();
        if (last_error_.ok()) {
            last_error_ = make_error(ErrorKind::Device, "Failed to open capture device");
        }
        device->close();
        return false;
    }

    accumulator_.clear();
    accumulator_.reserve(config_.frame_samples);
    device_rate_ = device->sample_rate();
    next_sequence_ = 0;
    level_ = 0.0f;

    Generation::Value gen = generation_->advance();
    std::weak_ptr<Generation> weak = generation_;

    bool started = device->start(
        [this, gen](const int16_t* samples, size_t num_samples) {
            on_samples(samples, num_samples, gen);
        },
        [this, weak, gen](const Error& error) {
            loop_.post([this, weak, gen, error]() {
                auto alive = weak.lock();
                if (!alive || !alive->is_current(gen)) return;
                handle_device_failure(error);
            });
        });

    if (!started) {
        last_error_ = device->last_error();
        if (last_error_.ok()) {
            last_error_ = make_error(ErrorKind::Device, "Failed to start capture");
        }
        device->close();
        generation_->advance();
        return false;
    }

    device_ = std::move(device);
    LV_LOG_INFO("Capture", "Capture started (gain %.1fx, %u samples/frame, %s)", config_.gain,
                config_.frame_samples, encoding_mode_name(config_.encoding));
    return true;
}

void CaptureGraph::stop() {
    if (!device_) {
        return;
    }

    // Frames already queued on the loop are dropped by generation
    generation_->advance();
    device_->close();
    device_.reset();
    accumulator_.clear();
    level_ = 0.0f;

    LV_LOG_INFO("Capture", "Capture stopped after %llu frames",
                static_cast<unsigned long long>(frames_emitted_));
}

void CaptureGraph::on_samples(const int16_t* samples, size_t num_samples, Generation::Value gen) {
    size_t offset = 0;
    while (offset < num_samples) {
        size_t room = config_.frame_samples - accumulator_.size();
        size_t take = std::min(room, num_samples - offset);
        accumulator_.insert(accumulator_.end(), samples + offset, samples + offset + take);
        offset += take;

        if (accumulator_.size() >= config_.frame_samples) {
            emit_frame(gen);
        }
    }
}

void CaptureGraph::emit_frame(Generation::Value gen) {
    apply_gain(accumulator_.data(), accumulator_.size(), config_.gain);

    AudioFrame frame;
    frame.sequence = next_sequence_++;
    frame.encoding = config_.encoding;
    frame.sample_rate = device_rate_;
    frame.num_samples = accumulator_.size();
    frame.level = compute_rms(accumulator_.data(), accumulator_.size());
    frame.bytes = encode_frame(config_.encoding, accumulator_.data(), accumulator_.size(),
                               device_rate_);
    accumulator_.clear();

    std::weak_ptr<Generation> weak = generation_;
    loop_.post([this, weak, gen, frame = std::move(frame)]() mutable {
        auto alive = weak.lock();
        if (!alive || !alive->is_current(gen)) return;

        level_ = frame.level;
        ++frames_emitted_;
        if (on_frame_) {
            on_frame_(std::move(frame));
        }
    });
}

void CaptureGraph::handle_device_failure(const Error& error) {
    LV_LOG_ERROR("Capture", "Capture device failed: %s", error.message.c_str());
    last_error_ = error;
    stop();
    if (on_failure_) {
        on_failure_(error);
    }
}

}  // namespace loanvoice
