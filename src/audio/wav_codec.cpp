/**
 * @file wav_codec.cpp
 * @brief LoanVoice - WAV codec implementation
 */

#include "loanvoice/audio/wav_codec.h"

#include <cstring>

namespace loanvoice {

static constexpr uint16_t WAV_FORMAT_PCM = 1;
static constexpr uint16_t WAV_FORMAT_EXTENSIBLE = 0xFFFE;
static constexpr uint16_t WAV_BITS_PER_SAMPLE_16 = 16;

static void write_uint16_le(uint8_t* buffer, uint16_t value) {
    buffer[0] = static_cast<uint8_t>(value & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

static void write_uint32_le(uint8_t* buffer, uint32_t value) {
    buffer[0] = static_cast<uint8_t>(value & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buffer[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

static uint16_t read_uint16_le(const uint8_t* buffer) {
    return static_cast<uint16_t>(buffer[0] | (buffer[1] << 8));
}

static uint32_t read_uint32_le(const uint8_t* buffer) {
    return static_cast<uint32_t>(buffer[0]) | (static_cast<uint32_t>(buffer[1]) << 8) |
           (static_cast<uint32_t>(buffer[2]) << 16) | (static_cast<uint32_t>(buffer[3]) << 24);
}

std::vector<uint8_t> wav_encode(const int16_t* samples, size_t num_samples, uint32_t sample_rate) {
    const uint32_t data_size = static_cast<uint32_t>(num_samples * sizeof(int16_t));
    std::vector<uint8_t> wav(kWavHeaderSize + data_size);
    uint8_t* header = wav.data();

    std::memcpy(&header[0], "RIFF", 4);
    write_uint32_le(&header[4], data_size + kWavHeaderSize - 8);
    std::memcpy(&header[8], "WAVE", 4);

    std::memcpy(&header[12], "fmt ", 4);
    write_uint32_le(&header[16], 16);
    write_uint16_le(&header[20], WAV_FORMAT_PCM);
    write_uint16_le(&header[22], 1);
    write_uint32_le(&header[24], sample_rate);
    write_uint32_le(&header[28], sample_rate * (WAV_BITS_PER_SAMPLE_16 / 8));
    write_uint16_le(&header[32], WAV_BITS_PER_SAMPLE_16 / 8);
    write_uint16_le(&header[34], WAV_BITS_PER_SAMPLE_16);

    std::memcpy(&header[36], "data", 4);
    write_uint32_le(&header[40], data_size);

    uint8_t* out = wav.data() + kWavHeaderSize;
    for (size_t i = 0; i < num_samples; ++i) {
        write_uint16_le(out + 2 * i, static_cast<uint16_t>(samples[i]));
    }
    return wav;
}

bool wav_decode(const uint8_t* data, size_t size, PcmAudio& out, std::string& error) {
    out = PcmAudio{};

    if (!data || size < 12) {
        error = "Buffer too small for a RIFF header";
        return false;
    }
    if (std::memcmp(data, "RIFF", 4) != 0) {
        error = "Not a WAV file (no RIFF header)";
        return false;
    }
    if (std::memcmp(data + 8, "WAVE", 4) != 0) {
        error = "Not a WAVE file";
        return false;
    }

    bool have_fmt = false;
    uint16_t bits_per_sample = 0;
    size_t offset = 12;

    while (offset + 8 <= size) {
        const uint8_t* chunk = data + offset;
        uint32_t chunk_size = read_uint32_le(chunk + 4);
        size_t body = offset + 8;
        size_t available = size - body;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16 || available < 16) {
                error = "Truncated fmt chunk";
                return false;
            }
            uint16_t audio_format = read_uint16_le(data + body);
            out.channels = read_uint16_le(data + body + 2);
            out.sample_rate = read_uint32_le(data + body + 4);
            bits_per_sample = read_uint16_le(data + body + 14);

            if (audio_format != WAV_FORMAT_PCM && audio_format != WAV_FORMAT_EXTENSIBLE) {
                error = "Unsupported WAV format " + std::to_string(audio_format);
                return false;
            }
            if (bits_per_sample != WAV_BITS_PER_SAMPLE_16) {
                error = "Unsupported bits per sample " + std::to_string(bits_per_sample);
                return false;
            }
            if (out.channels == 0 || out.sample_rate == 0) {
                error = "Invalid channel count or sample rate";
                return false;
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) {
                error = "data chunk before fmt chunk";
                return false;
            }
            // Placeholder or oversized lengths: take what is present
            size_t data_size = chunk_size;
            if (data_size == 0 || data_size > available) {
                data_size = available;
            }
            size_t block_align = static_cast<size_t>(out.channels) * 2;
            data_size -= data_size % block_align;
            if (data_size == 0) {
                error = "WAV holds no samples";
                return false;
            }

            out.samples.resize(data_size / 2);
            for (size_t i = 0; i < out.samples.size(); ++i) {
                out.samples[i] = static_cast<int16_t>(read_uint16_le(data + body + 2 * i));
            }
            return true;
        }

        // Chunks are padded to an even size
        size_t advance = static_cast<size_t>(chunk_size) + (chunk_size & 1);
        if (advance > available) break;
        offset = body + advance;
    }

    error = have_fmt ? "No data chunk" : "No fmt chunk";
    return false;
}

}  // namespace loanvoice
