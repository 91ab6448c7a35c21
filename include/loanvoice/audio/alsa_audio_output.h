/**
 * @file alsa_audio_output.h
 * @brief LoanVoice - ALSA speaker output for Linux
 *
 * A dedicated output thread writes one item at a time, reconfiguring the PCM
 * when an item's sample rate or channel count differs from the last one.
 */

#ifndef LOANVOICE_AUDIO_ALSA_AUDIO_OUTPUT_H
#define LOANVOICE_AUDIO_ALSA_AUDIO_OUTPUT_H

#include <memory>
#include <string>
#include <vector>

#include "loanvoice/audio/audio_output.h"

namespace loanvoice {

class AlsaAudioOutput : public AudioOutput {
public:
    AlsaAudioOutput();
    explicit AlsaAudioOutput(const OutputDeviceConfig& config);
    ~AlsaAudioOutput() override;

    // Non-copyable
    AlsaAudioOutput(const AlsaAudioOutput&) = delete;
    AlsaAudioOutput& operator=(const AlsaAudioOutput&) = delete;

    bool open() override;
    bool play(PcmAudio audio, CompletionCallback on_complete) override;
    void stop_current() override;
    bool is_busy() const override;
    void close() override;
    bool is_open() const override;
    const Error& last_error() const override { return last_error_; }

    const OutputDeviceConfig& config() const { return config_; }

    // List available playback devices
    static std::vector<std::string> list_devices();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    OutputDeviceConfig config_;
    Error last_error_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_AUDIO_ALSA_AUDIO_OUTPUT_H
