// =============================================================================
// Frame Transmitter - Implementation
// =============================================================================

#include "loanvoice/network/frame_transmitter.h"

#include "loanvoice/core/logger.h"
#include "loanvoice/network/transport_session.h"

namespace loanvoice {

bool FrameTransmitter::relay(const AudioFrame& frame) {
    if (!transport_.is_open() || !transport_.send_binary(frame.bytes)) {
        ++frames_dropped_;
        // Log the first drop and then every 50th so a dead socket does not flood
        if (frames_dropped_ == 1 || frames_dropped_ % 50 == 0) {
            LV_LOG_DEBUG("Transport", "Dropped audio frame #%llu (%llu dropped so far)",
                         static_cast<unsigned long long>(frame.sequence),
                         static_cast<unsigned long long>(frames_dropped_));
        }
        return false;
    }
    ++frames_sent_;
    last_sequence_ = frame.sequence;
    return true;
}

void FrameTransmitter::reset_counters() {
    frames_sent_ = 0;
    frames_dropped_ = 0;
    last_sequence_ = 0;
}

}  // namespace loanvoice
