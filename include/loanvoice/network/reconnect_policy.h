/**
 * @file reconnect_policy.h
 * @brief LoanVoice - Per-channel reconnection policy
 *
 * The primary voice channel never reconnects on its own; the user retries by
 * starting a call again. Side channels reconnect with exponential backoff.
 */

#ifndef LOANVOICE_NETWORK_RECONNECT_POLICY_H
#define LOANVOICE_NETWORK_RECONNECT_POLICY_H

#include <cstdint>

namespace loanvoice {

struct ReconnectPolicy {
    bool auto_reconnect = false;
    int max_attempts = 0;
    uint32_t base_delay_ms = 1000;
    uint32_t max_delay_ms = 30000;

    // Manual reconnect only
    static ReconnectPolicy primary() {
        return ReconnectPolicy{false, 0, 1000, 30000};
    }

    // 5 attempts: 1 s, 2 s, 4 s, 8 s, 16 s
    static ReconnectPolicy side_channel() {
        return ReconnectPolicy{true, 5, 1000, 30000};
    }

    /**
     * @brief min(base * 2^attempt, max), attempt counted from 0.
     */
    uint32_t delay_for_attempt(int attempt) const;

    // Whether another attempt is allowed after `attempts_made` consecutive failures
    bool should_retry(int attempts_made) const {
        return auto_reconnect && attempts_made < max_attempts;
    }
};

}  // namespace loanvoice

#endif  // LOANVOICE_NETWORK_RECONNECT_POLICY_H
