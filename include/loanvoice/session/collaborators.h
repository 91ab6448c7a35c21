/**
 * @file collaborators.h
 * @brief LoanVoice - Interfaces to the systems around the voice core
 *
 * Eligibility scoring, document verification and login live outside the
 * voice client. The session only hands them data at the documented points.
 */

#ifndef LOANVOICE_SESSION_COLLABORATORS_H
#define LOANVOICE_SESSION_COLLABORATORS_H

#include <string>

#include "loanvoice/conversation/conversation_state.h"

namespace loanvoice {

// =============================================================================
// Decision result view
// =============================================================================

class EligibilityView {
public:
    virtual ~EligibilityView() = default;

    // Conversation is frozen when this is called
    virtual void show_eligibility(const EligibilityResult& result) = 0;
};

// =============================================================================
// Document verification flow
// =============================================================================

class VerificationFlow {
public:
    virtual ~VerificationFlow() = default;

    // Server supplied an application id
    virtual void start_verification(const VerificationHandoff& handoff) = 0;

    // No id yet; the user must proceed explicitly (VoiceSession::proceed_to_verification)
    virtual void verification_action_required(const VerificationHandoff& handoff) = 0;
};

// =============================================================================
// Bearer token source
// =============================================================================

class TokenProvider {
public:
    virtual ~TokenProvider() = default;

    // Empty when no session is stored
    virtual std::string token() = 0;
};

class StaticTokenProvider : public TokenProvider {
public:
    explicit StaticTokenProvider(std::string token) : token_(std::move(token)) {}
    std::string token() override { return token_; }

private:
    std::string token_;
};

/**
 * @brief Reads the token from a session store file, falling back to an
 * environment variable.
 *
 * The file may hold the bare token or a JSON object with a "token" or
 * "access_token" string. It is re-read on every call so a refreshed login
 * is picked up by the next connect.
 */
class SessionStoreTokenProvider : public TokenProvider {
public:
    SessionStoreTokenProvider(std::string path, std::string env_var);

    std::string token() override;

private:
    std::string path_;
    std::string env_var_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_SESSION_COLLABORATORS_H
