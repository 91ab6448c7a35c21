// =============================================================================
// ALSA Capture Device - Implementation
// =============================================================================

#include "loanvoice/audio/alsa_capture_device.h"

#include <atomic>
#include <cerrno>
#include <thread>
#include <vector>

#include "alsa_common.h"
#include "loanvoice/core/logger.h"

namespace loanvoice {

struct AlsaCaptureDevice::Impl {
    snd_pcm_t* pcm_handle = nullptr;
    std::thread capture_thread;
    std::atomic<bool> running{false};
    std::vector<int16_t> buffer;
    snd_pcm_uframes_t period_frames = 0;
};

AlsaCaptureDevice::AlsaCaptureDevice() : impl_(std::make_unique<Impl>()) {}

AlsaCaptureDevice::~AlsaCaptureDevice() {
    close();
}

ErrorKind AlsaCaptureDevice::classify_open_error(int err) {
    if (err == -EACCES || err == -EPERM) {
        return ErrorKind::Permission;
    }
    return ErrorKind::Device;
}

bool AlsaCaptureDevice::open(const CaptureDeviceConfig& config) {
    if (impl_->pcm_handle) {
        return true;
    }
    config_ = config;
    last_error_ = Error{};

    int err = snd_pcm_open(&impl_->pcm_handle, config_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        impl_->pcm_handle = nullptr;
        ErrorKind kind = classify_open_error(err);
        last_error_ = make_error(kind, kind == ErrorKind::Permission
                                           ? std::string("Microphone access denied: ") + snd_strerror(err)
                                           : std::string("Cannot open capture device '") +
                                                 config_.device + "': " + snd_strerror(err));
        LV_LOG_ERROR("Capture", "%s", last_error_.message.c_str());
        return false;
    }

    alsa::PcmParams params{config_.sample_rate, config_.channels, config_.buffer_frames,
                           config_.period_frames};
    std::string error;
    if (!alsa::configure_pcm(impl_->pcm_handle, params, error)) {
        snd_pcm_close(impl_->pcm_handle);
        impl_->pcm_handle = nullptr;
        last_error_ = make_error(ErrorKind::Device, error);
        LV_LOG_ERROR("Capture", "%s", error.c_str());
        return false;
    }

    if (params.sample_rate != config_.sample_rate) {
        LV_LOG_WARNING("Capture", "Requested %u Hz, device negotiated %u Hz", config_.sample_rate,
                       params.sample_rate);
    }
    config_.sample_rate = params.sample_rate;
    config_.buffer_frames = static_cast<uint32_t>(params.buffer_frames);
    config_.period_frames = static_cast<uint32_t>(params.period_frames);

    if (config_.echo_cancellation || config_.noise_suppression) {
        LV_LOG_DEBUG("Capture", "Echo cancellation/noise suppression delegated to PCM '%s'",
                     config_.device.c_str());
    }

    impl_->period_frames = params.period_frames;
    impl_->buffer.resize(params.period_frames * config_.channels);

    LV_LOG_INFO("Capture", "Opened '%s' at %u Hz (period %u frames)", config_.device.c_str(),
                config_.sample_rate, config_.period_frames);
    return true;
}

bool AlsaCaptureDevice::start(CaptureSamplesCallback on_samples, CaptureErrorCallback on_error) {
    if (!impl_->pcm_handle) {
        last_error_ = make_error(ErrorKind::Device, "Capture device not open");
        return false;
    }
    if (impl_->running) {
        return true;
    }

    impl_->running = true;
    impl_->capture_thread = std::thread([this, on_samples = std::move(on_samples),
                                         on_error = std::move(on_error)]() {
        while (impl_->running) {
            snd_pcm_sframes_t frames =
                snd_pcm_readi(impl_->pcm_handle, impl_->buffer.data(), impl_->period_frames);

            if (frames < 0) {
                // Overrun: recover and keep going
                if (frames == -EPIPE || frames == -ESTRPIPE) {
                    snd_pcm_prepare(impl_->pcm_handle);
                    continue;
                } else if (frames == -EAGAIN) {
                    continue;
                } else if (!impl_->running) {
                    break;
                }
                impl_->running = false;
                if (on_error) {
                    on_error(make_error(ErrorKind::Device,
                                        std::string("Capture read failed: ") +
                                            snd_strerror(static_cast<int>(frames))));
                }
                break;
            }

            if (on_samples && frames > 0) {
                on_samples(impl_->buffer.data(), static_cast<size_t>(frames) * config_.channels);
            }
        }
    });

    return true;
}

void AlsaCaptureDevice::close() {
    impl_->running = false;

    // A blocked snd_pcm_readi returns within one period
    if (impl_->capture_thread.joinable()) {
        impl_->capture_thread.join();
    }

    if (impl_->pcm_handle) {
        snd_pcm_drop(impl_->pcm_handle);
        snd_pcm_close(impl_->pcm_handle);
        impl_->pcm_handle = nullptr;
        LV_LOG_DEBUG("Capture", "Released '%s'", config_.device.c_str());
    }
}

bool AlsaCaptureDevice::is_open() const {
    return impl_->pcm_handle != nullptr;
}

std::vector<std::string> AlsaCaptureDevice::list_devices() {
    return alsa::list_pcm_devices("Input");
}

}  // namespace loanvoice
