// =============================================================================
// ALSA helpers - Implementation
// =============================================================================

#include "alsa_common.h"

#include <cstdlib>
#include <cstring>

namespace loanvoice {
namespace alsa {

bool configure_pcm(snd_pcm_t* pcm, PcmParams& params, std::string& error) {
    int err;

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(pcm, hw_params);

    err = snd_pcm_hw_params_set_access(pcm, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) {
        error = std::string("Cannot set access type: ") + snd_strerror(err);
        return false;
    }

    err = snd_pcm_hw_params_set_format(pcm, hw_params, SND_PCM_FORMAT_S16_LE);
    if (err < 0) {
        error = std::string("Cannot set sample format: ") + snd_strerror(err);
        return false;
    }

    unsigned int rate = params.sample_rate;
    err = snd_pcm_hw_params_set_rate_near(pcm, hw_params, &rate, nullptr);
    if (err < 0) {
        error = std::string("Cannot set sample rate: ") + snd_strerror(err);
        return false;
    }
    params.sample_rate = rate;

    err = snd_pcm_hw_params_set_channels(pcm, hw_params, params.channels);
    if (err < 0) {
        error = std::string("Cannot set channels: ") + snd_strerror(err);
        return false;
    }

    snd_pcm_uframes_t buffer_size = params.buffer_frames;
    err = snd_pcm_hw_params_set_buffer_size_near(pcm, hw_params, &buffer_size);
    if (err < 0) {
        error = std::string("Cannot set buffer size: ") + snd_strerror(err);
        return false;
    }
    params.buffer_frames = buffer_size;

    snd_pcm_uframes_t period_size = params.period_frames;
    err = snd_pcm_hw_params_set_period_size_near(pcm, hw_params, &period_size, nullptr);
    if (err < 0) {
        error = std::string("Cannot set period size: ") + snd_strerror(err);
        return false;
    }
    params.period_frames = period_size;

    err = snd_pcm_hw_params(pcm, hw_params);
    if (err < 0) {
        error = std::string("Cannot set hardware parameters: ") + snd_strerror(err);
        return false;
    }

    err = snd_pcm_prepare(pcm);
    if (err < 0) {
        error = std::string("Cannot prepare device: ") + snd_strerror(err);
        return false;
    }

    return true;
}

std::vector<std::string> list_pcm_devices(const char* direction) {
    std::vector<std::string> devices;
    devices.push_back("default");

    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) < 0) {
        return devices;
    }

    for (void** hint = hints; *hint != nullptr; ++hint) {
        char* name = snd_device_name_get_hint(*hint, "NAME");
        char* ioid = snd_device_name_get_hint(*hint, "IOID");

        // A missing IOID means the PCM supports both directions
        if (name && (!ioid || std::strcmp(ioid, direction) == 0) &&
            std::strcmp(name, "default") != 0) {
            devices.push_back(name);
        }

        if (name) free(name);
        if (ioid) free(ioid);
    }

    snd_device_name_free_hint(hints);
    return devices;
}

}  // namespace alsa
}  // namespace loanvoice
