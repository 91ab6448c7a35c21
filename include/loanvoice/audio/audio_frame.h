/**
 * @file audio_frame.h
 * @brief LoanVoice - Captured audio frame
 *
 * An AudioFrame is created by the capture graph and consumed exactly once by
 * the transmitter. It has no identity beyond its capture sequence number.
 */

#ifndef LOANVOICE_AUDIO_AUDIO_FRAME_H
#define LOANVOICE_AUDIO_AUDIO_FRAME_H

#include <cstdint>
#include <string>
#include <vector>

namespace loanvoice {

/**
 * @brief Wire encoding of outbound audio frames.
 */
enum class EncodingMode {
    Pcm16le,  ///< Raw little-endian int16 mono samples, no envelope
    Wav,      ///< Each frame is a self-contained RIFF/WAVE PCM16 chunk
};

const char* encoding_mode_name(EncodingMode mode);
bool parse_encoding_mode(const std::string& name, EncodingMode& out);

struct AudioFrame {
    std::vector<uint8_t> bytes;
    uint64_t sequence = 0;
    EncodingMode encoding = EncodingMode::Pcm16le;
    uint32_t sample_rate = 0;
    size_t num_samples = 0;
    float level = 0.0f;  ///< Normalized RMS of the boosted signal
};

/**
 * @brief Encode boosted samples for the wire.
 */
std::vector<uint8_t> encode_frame(EncodingMode mode, const int16_t* samples, size_t num_samples,
                                  uint32_t sample_rate);

}  // namespace loanvoice

#endif  // LOANVOICE_AUDIO_AUDIO_FRAME_H
