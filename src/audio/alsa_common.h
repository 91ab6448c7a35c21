// =============================================================================
// ALSA helpers shared by capture and output devices
// =============================================================================

#ifndef LOANVOICE_SRC_AUDIO_ALSA_COMMON_H
#define LOANVOICE_SRC_AUDIO_ALSA_COMMON_H

#include <alsa/asoundlib.h>

#include <string>
#include <vector>

namespace loanvoice {
namespace alsa {

struct PcmParams {
    unsigned int sample_rate;
    unsigned int channels;
    snd_pcm_uframes_t buffer_frames;
    snd_pcm_uframes_t period_frames;
};

/**
 * Apply interleaved S16_LE hardware parameters and prepare the device.
 * Negotiated rate and sizes are written back into `params`.
 */
bool configure_pcm(snd_pcm_t* pcm, PcmParams& params, std::string& error);

// Device names whose IOID matches `direction` ("Input" or "Output"), "default" first
std::vector<std::string> list_pcm_devices(const char* direction);

}  // namespace alsa
}  // namespace loanvoice

#endif  // LOANVOICE_SRC_AUDIO_ALSA_COMMON_H
