/**
 * @file capture_device.h
 * @brief LoanVoice - Microphone device abstraction
 *
 * A CaptureDevice owns the exclusive handle on one microphone. Samples and
 * read failures are delivered from the device's own thread; consumers must
 * hop back onto the event loop before touching any session state.
 */

#ifndef LOANVOICE_AUDIO_CAPTURE_DEVICE_H
#define LOANVOICE_AUDIO_CAPTURE_DEVICE_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "loanvoice/core/error.h"

namespace loanvoice {

// Audio capture configuration
struct CaptureDeviceConfig {
    std::string device;          // ALSA device (default: "default")
    uint32_t sample_rate;        // Target sample rate in Hz (default: 16000)
    uint32_t channels;           // Number of channels (default: 1)
    uint32_t buffer_frames;      // Frames per buffer (default: 2048)
    uint32_t period_frames;      // Frames per period (default: 512)
    bool echo_cancellation;      // Requested from the device layer where offered
    bool noise_suppression;

    static CaptureDeviceConfig defaults() {
        return {
            .device = "default",
            .sample_rate = 16000,
            .channels = 1,
            .buffer_frames = 2048,
            .period_frames = 512,
            .echo_cancellation = true,
            .noise_suppression = true
        };
    }
};

// Receives 16-bit mono samples on the device thread
using CaptureSamplesCallback = std::function<void(const int16_t* samples, size_t num_samples)>;

// Fatal read failure, delivered once on the device thread
using CaptureErrorCallback = std::function<void(const Error& error)>;

class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    /**
     * @brief Acquire the microphone.
     * @return false with a Permission or Device error in last_error()
     */
    virtual bool open(const CaptureDeviceConfig& config) = 0;

    // Begin delivering samples. Requires open().
    virtual bool start(CaptureSamplesCallback on_samples, CaptureErrorCallback on_error) = 0;

    // Stop delivery, join the device thread and release the handle. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // Rate actually negotiated with the hardware
    virtual uint32_t sample_rate() const = 0;

    virtual const Error& last_error() const = 0;
};

using CaptureDeviceFactory = std::function<std::unique_ptr<CaptureDevice>()>;

}  // namespace loanvoice

#endif  // LOANVOICE_AUDIO_CAPTURE_DEVICE_H
