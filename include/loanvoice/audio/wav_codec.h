/**
 * @file wav_codec.h
 * @brief LoanVoice - RIFF/WAVE PCM16 encode and decode
 *
 * Synthesized speech arrives as base64 RIFF/WAVE linear16 payloads. Streaming
 * TTS backends often write placeholder sizes (0 or 0xFFFFFFFF) into the RIFF
 * and data headers, so the decoder trusts the bytes actually present.
 */

#ifndef LOANVOICE_AUDIO_WAV_CODEC_H
#define LOANVOICE_AUDIO_WAV_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace loanvoice {

static constexpr size_t kWavHeaderSize = 44;

/**
 * @brief Decoded interleaved PCM16 audio.
 */
struct PcmAudio {
    std::vector<int16_t> samples;  ///< Interleaved when channels > 1
    uint32_t sample_rate = 0;
    uint16_t channels = 1;

    size_t frames() const { return channels ? samples.size() / channels : 0; }
    double duration_sec() const {
        return sample_rate ? static_cast<double>(frames()) / sample_rate : 0.0;
    }
};

/**
 * @brief Build a mono PCM16 WAV file (44-byte header + data).
 */
std::vector<uint8_t> wav_encode(const int16_t* samples, size_t num_samples, uint32_t sample_rate);

/**
 * @brief Decode a RIFF/WAVE buffer holding 16-bit PCM.
 *
 * @param error Set to a human-readable reason on failure
 * @return false if the buffer is not a PCM16 WAV or holds no samples
 */
bool wav_decode(const uint8_t* data, size_t size, PcmAudio& out, std::string& error);

inline bool wav_decode(const std::vector<uint8_t>& data, PcmAudio& out, std::string& error) {
    return wav_decode(data.data(), data.size(), out, error);
}

}  // namespace loanvoice

#endif  // LOANVOICE_AUDIO_WAV_CODEC_H
