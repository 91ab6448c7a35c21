/**
 * @file audio_output.h
 * @brief LoanVoice - Speaker output context abstraction
 *
 * The output context is opened once per session and reused for every
 * playback item. It plays one item at a time; the completion callback fires
 * on the output thread once the item has finished or was halted.
 */

#ifndef LOANVOICE_AUDIO_AUDIO_OUTPUT_H
#define LOANVOICE_AUDIO_AUDIO_OUTPUT_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "loanvoice/audio/wav_codec.h"
#include "loanvoice/core/error.h"

namespace loanvoice {

// Audio output configuration
struct OutputDeviceConfig {
    std::string device;          // ALSA device (default: "default")
    uint32_t sample_rate;        // Initial rate; each item reconfigures to its own
    uint32_t buffer_frames;      // Frames per buffer (default: 4096)
    uint32_t period_frames;      // Frames per period (default: 1024)

    static OutputDeviceConfig defaults() {
        return {
            .device = "default",
            .sample_rate = 24000,
            .buffer_frames = 4096,
            .period_frames = 1024
        };
    }
};

class AudioOutput {
public:
    // completed == false when the item was halted or failed mid-write
    using CompletionCallback = std::function<void(bool completed)>;

    virtual ~AudioOutput() = default;

    // Create the output context. Idempotent.
    virtual bool open() = 0;

    /**
     * @brief Start playing one decoded item without blocking.
     * @return false if the context is closed or busy
     */
    virtual bool play(PcmAudio audio, CompletionCallback on_complete) = 0;

    // Halt the active item. The output may stay busy until the halt lands;
    // the halted item's completion then fires with completed == false.
    virtual void stop_current() = 0;

    // An item is playing or still being halted
    virtual bool is_busy() const = 0;

    // Release the context. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
    virtual const Error& last_error() const = 0;
};

using AudioOutputFactory = std::function<std::unique_ptr<AudioOutput>()>;

}  // namespace loanvoice

#endif  // LOANVOICE_AUDIO_AUDIO_OUTPUT_H
