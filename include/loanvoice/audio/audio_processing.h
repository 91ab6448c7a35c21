/**
 * @file audio_processing.h
 * @brief LoanVoice - Gain stage and level analyzer for captured audio
 */

#ifndef LOANVOICE_AUDIO_AUDIO_PROCESSING_H
#define LOANVOICE_AUDIO_AUDIO_PROCESSING_H

#include <cstddef>
#include <cstdint>

namespace loanvoice {

/**
 * @brief Multiply samples in place by `gain`, saturating at the int16 range.
 */
void apply_gain(int16_t* samples, size_t num_samples, float gain);

/**
 * @brief Root-mean-square level normalized to 0.0-1.0 (full scale = 1.0).
 * Returns 0 for an empty buffer.
 */
float compute_rms(const int16_t* samples, size_t num_samples);

}  // namespace loanvoice

#endif  // LOANVOICE_AUDIO_AUDIO_PROCESSING_H
