// =============================================================================
// Audio Processing - Gain and RMS
// =============================================================================

#include "loanvoice/audio/audio_processing.h"

#include <algorithm>
#include <cmath>

namespace loanvoice {

void apply_gain(int16_t* samples, size_t num_samples, float gain) {
    if (gain == 1.0f) return;
    for (size_t i = 0; i < num_samples; ++i) {
        float v = static_cast<float>(samples[i]) * gain;
        v = std::clamp(v, -32768.0f, 32767.0f);
        samples[i] = static_cast<int16_t>(v);
    }
}

float compute_rms(const int16_t* samples, size_t num_samples) {
    if (num_samples == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < num_samples; ++i) {
        double s = samples[i] / 32768.0;
        sum += s * s;
    }
    double rms = std::sqrt(sum / static_cast<double>(num_samples));
    return static_cast<float>(std::min(rms, 1.0));
}

}  // namespace loanvoice
