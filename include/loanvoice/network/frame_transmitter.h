/**
 * @file frame_transmitter.h
 * @brief LoanVoice - Relay of captured frames onto the transport
 *
 * Frames go out only while the transport is open. There is no queue: a frame
 * that cannot be sent right now is dropped so stale audio never builds up.
 */

#ifndef LOANVOICE_NETWORK_FRAME_TRANSMITTER_H
#define LOANVOICE_NETWORK_FRAME_TRANSMITTER_H

#include <cstdint>

#include "loanvoice/audio/audio_frame.h"

namespace loanvoice {

class TransportSession;

class FrameTransmitter {
public:
    explicit FrameTransmitter(TransportSession& transport) : transport_(transport) {}

    // Returns true if the frame was handed to the socket
    bool relay(const AudioFrame& frame);

    uint64_t frames_sent() const { return frames_sent_; }
    uint64_t frames_dropped() const { return frames_dropped_; }
    uint64_t last_sequence() const { return last_sequence_; }

    void reset_counters();

private:
    TransportSession& transport_;
    uint64_t frames_sent_ = 0;
    uint64_t frames_dropped_ = 0;
    uint64_t last_sequence_ = 0;
};

}  // namespace loanvoice

#endif  // LOANVOICE_NETWORK_FRAME_TRANSMITTER_H
