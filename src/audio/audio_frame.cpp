// =============================================================================
// Audio Frame - Encoding
// =============================================================================

#include "loanvoice/audio/audio_frame.h"

#include "loanvoice/audio/wav_codec.h"

namespace loanvoice {

const char* encoding_mode_name(EncodingMode mode) {
    switch (mode) {
        case EncodingMode::Pcm16le: return "pcm16le";
        case EncodingMode::Wav:     return "wav";
    }
    return "unknown";
}

bool parse_encoding_mode(const std::string& name, EncodingMode& out) {
    if (name == "pcm16le" || name == "pcm" || name == "linear16") {
        out = EncodingMode::Pcm16le;
        return true;
    }
    if (name == "wav") {
        out = EncodingMode::Wav;
        return true;
    }
    return false;
}

std::vector<uint8_t> encode_frame(EncodingMode mode, const int16_t* samples, size_t num_samples,
                                  uint32_t sample_rate) {
    if (mode == EncodingMode::Wav) {
        return wav_encode(samples, num_samples, sample_rate);
    }

    std::vector<uint8_t> bytes(num_samples * 2);
    for (size_t i = 0; i < num_samples; ++i) {
        uint16_t v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<uint8_t>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    }
    return bytes;
}

}  // namespace loanvoice
