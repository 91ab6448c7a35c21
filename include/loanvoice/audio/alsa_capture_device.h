/**
 * @file alsa_capture_device.h
 * @brief LoanVoice - ALSA microphone capture for Linux
 *
 * Audio format: 16-bit PCM mono at the requested rate (16 kHz by default).
 * ALSA offers no echo cancellation or noise suppression of its own; point
 * `device` at a PCM that provides them (e.g. a PipeWire echo-cancel source).
 */

#ifndef LOANVOICE_AUDIO_ALSA_CAPTURE_DEVICE_H
#define LOANVOICE_AUDIO_ALSA_CAPTURE_DEVICE_H

#include <memory>
#include <string>
#include <vector>

#include "loanvoice/audio/capture_device.h"

namespace loanvoice {

class AlsaCaptureDevice : public CaptureDevice {
public:
    AlsaCaptureDevice();
    ~AlsaCaptureDevice() override;

    // Non-copyable
    AlsaCaptureDevice(const AlsaCaptureDevice&) = delete;
    AlsaCaptureDevice& operator=(const AlsaCaptureDevice&) = delete;

    bool open(const CaptureDeviceConfig& config) override;
    bool start(CaptureSamplesCallback on_samples, CaptureErrorCallback on_error) override;
    void close() override;
    bool is_open() const override;
    uint32_t sample_rate() const override { return config_.sample_rate; }
    const Error& last_error() const override { return last_error_; }

    // List available capture devices
    static std::vector<std::string> list_devices();

    // Classify a negative ALSA return code from snd_pcm_open
    static ErrorKind classify_open_error(int err);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    CaptureDeviceConfig config_ = CaptureDeviceConfig::defaults();
    Error last_error_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_AUDIO_ALSA_CAPTURE_DEVICE_H
