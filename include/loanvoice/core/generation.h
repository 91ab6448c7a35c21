/**
 * @file generation.h
 * @brief LoanVoice - Generation counter for stale-completion detection
 *
 * Async work (connect, capture frames, playback completion) captures the
 * generation that was current when it started. When the completion is
 * delivered on the event loop it is only acted upon if that generation is
 * still current; advancing the counter therefore cancels every outstanding
 * completion at once.
 */

#ifndef LOANVOICE_CORE_GENERATION_H
#define LOANVOICE_CORE_GENERATION_H

#include <atomic>
#include <cstdint>

namespace loanvoice {

class Generation {
public:
    using Value = uint64_t;

    Value current() const { return value_.load(); }

    // Invalidate everything issued so far; returns the new generation
    Value advance() { return ++value_; }

    bool is_current(Value v) const { return v == value_.load(); }

private:
    std::atomic<Value> value_{1};
};

}  // namespace loanvoice

#endif  // LOANVOICE_CORE_GENERATION_H
