// =============================================================================
// Reconnect Policy - Implementation
// =============================================================================

#include "loanvoice/network/reconnect_policy.h"

namespace loanvoice {

uint32_t ReconnectPolicy::delay_for_attempt(int attempt) const {
    if (attempt < 0) attempt = 0;
    uint64_t delay = base_delay_ms;
    for (int i = 0; i < attempt && delay < max_delay_ms; ++i) {
        delay *= 2;
    }
    return delay > max_delay_ms ? max_delay_ms : static_cast<uint32_t>(delay);
}

}  // namespace loanvoice
