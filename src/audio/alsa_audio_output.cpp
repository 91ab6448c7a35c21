// =============================================================================
// ALSA Audio Output - Implementation
// =============================================================================

#include "loanvoice/audio/alsa_audio_output.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "alsa_common.h"
#include "loanvoice/core/logger.h"

namespace loanvoice {

struct AlsaAudioOutput::Impl {
    snd_pcm_t* pcm_handle = nullptr;
    alsa::PcmParams params{};
    uint32_t configured_rate = 0;
    uint32_t configured_channels = 0;

    std::thread output_thread;
    std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable idle_cv;
    bool has_job = false;
    bool busy = false;
    bool shutdown = false;
    PcmAudio job_audio;
    CompletionCallback job_callback;

    std::atomic<bool> stop_requested{false};
};

namespace {

constexpr int kStopTimeoutMs = 2000;

bool open_pcm(const std::string& device, uint32_t rate, uint32_t channels,
              const OutputDeviceConfig& config, snd_pcm_t** out, alsa::PcmParams& params,
              std::string& error) {
    int err = snd_pcm_open(out, device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        *out = nullptr;
        error = std::string("Cannot open audio device '") + device + "': " + snd_strerror(err);
        return false;
    }

    params = alsa::PcmParams{rate, channels, config.buffer_frames, config.period_frames};
    if (!alsa::configure_pcm(*out, params, error)) {
        snd_pcm_close(*out);
        *out = nullptr;
        return false;
    }
    return true;
}

// Write all frames, honoring a stop request between periods
bool write_all(snd_pcm_t* pcm, const PcmAudio& audio, snd_pcm_uframes_t period,
               const std::atomic<bool>& stop_requested) {
    size_t frames_remaining = audio.frames();
    const int16_t* ptr = audio.samples.data();

    while (frames_remaining > 0 && !stop_requested) {
        snd_pcm_uframes_t chunk = std::min<snd_pcm_uframes_t>(period, frames_remaining);
        snd_pcm_sframes_t frames = snd_pcm_writei(pcm, ptr, chunk);

        if (frames < 0) {
            // Underrun
            if (frames == -EPIPE) {
                snd_pcm_prepare(pcm);
                continue;
            } else if (frames == -EAGAIN) {
                snd_pcm_wait(pcm, 100);
                continue;
            }
            LV_LOG_ERROR("Playback", "Write error: %s", snd_strerror(static_cast<int>(frames)));
            return false;
        }

        frames_remaining -= static_cast<size_t>(frames);
        ptr += static_cast<size_t>(frames) * audio.channels;
    }
    return true;
}

// Wait for queued frames to play out, polling so a stop request is noticed
void wait_played(snd_pcm_t* pcm, const std::atomic<bool>& stop_requested) {
    while (!stop_requested) {
        snd_pcm_sframes_t delay = 0;
        if (snd_pcm_delay(pcm, &delay) < 0 || delay <= 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace

AlsaAudioOutput::AlsaAudioOutput() : AlsaAudioOutput(OutputDeviceConfig::defaults()) {}

AlsaAudioOutput::AlsaAudioOutput(const OutputDeviceConfig& config)
    : impl_(std::make_unique<Impl>()), config_(config) {}

AlsaAudioOutput::~AlsaAudioOutput() {
    close();
}

bool AlsaAudioOutput::open() {
    if (impl_->pcm_handle) {
        return true;
    }
    last_error_ = Error{};

    std::string error;
    if (!open_pcm(config_.device, config_.sample_rate, 1, config_, &impl_->pcm_handle,
                  impl_->params, error)) {
        last_error_ = make_error(ErrorKind::Device, error);
        LV_LOG_ERROR("Playback", "%s", error.c_str());
        return false;
    }
    impl_->configured_rate = config_.sample_rate;
    impl_->configured_channels = 1;

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->shutdown = false;
        impl_->has_job = false;
        impl_->busy = false;
    }

    impl_->output_thread = std::thread([this]() {
        Impl& impl = *impl_;
        while (true) {
            PcmAudio audio;
            CompletionCallback callback;
            {
                std::unique_lock<std::mutex> lock(impl.mutex);
                impl.cv.wait(lock, [&impl] { return impl.shutdown || impl.has_job; });
                if (impl.shutdown) return;
                audio = std::move(impl.job_audio);
                callback = std::move(impl.job_callback);
                impl.has_job = false;
            }

            bool completed = true;
            if (audio.sample_rate != impl.configured_rate ||
                audio.channels != impl.configured_channels) {
                // Reinitialize at the item's format
                snd_pcm_close(impl.pcm_handle);
                impl.pcm_handle = nullptr;
                std::string error;
                if (open_pcm(config_.device, audio.sample_rate, audio.channels, config_,
                             &impl.pcm_handle, impl.params, error)) {
                    impl.configured_rate = audio.sample_rate;
                    impl.configured_channels = audio.channels;
                    LV_LOG_DEBUG("Playback", "Output reconfigured to %u Hz, %u ch",
                                 impl.params.sample_rate, impl.params.channels);
                } else {
                    LV_LOG_ERROR("Playback", "%s", error.c_str());
                    impl.configured_rate = 0;
                    completed = false;
                }
            }

            if (completed && impl.pcm_handle) {
                completed = write_all(impl.pcm_handle, audio, impl.params.period_frames,
                                      impl.stop_requested);
                if (completed) {
                    wait_played(impl.pcm_handle, impl.stop_requested);
                }
                if (impl.stop_requested) {
                    snd_pcm_drop(impl.pcm_handle);
                    snd_pcm_prepare(impl.pcm_handle);
                    completed = false;
                }
            }

            {
                std::lock_guard<std::mutex> lock(impl.mutex);
                impl.busy = false;
            }
            impl.idle_cv.notify_all();
            if (callback) {
                callback(completed);
            }
        }
    });

    LV_LOG_INFO("Playback", "Output context opened on '%s'", config_.device.c_str());
    return true;
}

bool AlsaAudioOutput::play(PcmAudio audio, CompletionCallback on_complete) {
    if (!impl_->output_thread.joinable()) {
        last_error_ = make_error(ErrorKind::Device, "Output context not open");
        return false;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->busy) {
        last_error_ = make_error(ErrorKind::Device, "Output busy");
        return false;
    }
    impl_->stop_requested = false;
    impl_->job_audio = std::move(audio);
    impl_->job_callback = std::move(on_complete);
    impl_->has_job = true;
    impl_->busy = true;
    impl_->cv.notify_one();
    return true;
}

void AlsaAudioOutput::stop_current() {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    if (!impl_->busy) {
        return;
    }
    impl_->stop_requested = true;

    // The writer notices within one period, drops the PCM and clears busy
    Impl& impl = *impl_;
    if (!impl.idle_cv.wait_for(lock, std::chrono::milliseconds(kStopTimeoutMs),
                               [&impl] { return !impl.busy; })) {
        LV_LOG_WARNING("Playback", "Output still halting after %d ms", kStopTimeoutMs);
    }
}

bool AlsaAudioOutput::is_busy() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->busy;
}

void AlsaAudioOutput::close() {
    if (impl_->output_thread.joinable()) {
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            impl_->shutdown = true;
        }
        impl_->stop_requested = true;
        impl_->cv.notify_one();
        impl_->output_thread.join();
    }

    if (impl_->pcm_handle) {
        snd_pcm_drop(impl_->pcm_handle);
        snd_pcm_close(impl_->pcm_handle);
        impl_->pcm_handle = nullptr;
        LV_LOG_INFO("Playback", "Output context released");
    }
}

bool AlsaAudioOutput::is_open() const {
    return impl_->output_thread.joinable();
}

std::vector<std::string> AlsaAudioOutput::list_devices() {
    return alsa::list_pcm_devices("Output");
}

}  // namespace loanvoice
