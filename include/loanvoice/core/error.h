/**
 * @file error.h
 * @brief LoanVoice - Structured error model
 *
 * Every failure the voice client can observe is expressed as an Error value
 * tagged with an ErrorKind. Components report failures through `bool`
 * returns plus `last_error()`; the session turns them into state transitions
 * and listener notifications.
 */

#ifndef LOANVOICE_CORE_ERROR_H
#define LOANVOICE_CORE_ERROR_H

#include <string>

namespace loanvoice {

enum class ErrorKind {
    None = 0,
    Permission,  ///< Microphone access denied
    Device,      ///< No usable capture/playback device
    Transport,   ///< Socket connect/handshake/IO failure
    Protocol,    ///< Malformed or unknown inbound message
    Decode,      ///< Corrupt audio payload
    Server,      ///< Backend reported an error message
    Config,      ///< Invalid configuration
    Session,     ///< Operation refused in the current conversation state
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
    explicit operator bool() const { return !ok(); }

    /** "Category: message" */
    std::string to_string() const;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

/**
 * @brief Category string for an error kind (e.g. "Permission", "Transport")
 */
const char* error_category(ErrorKind kind);

/**
 * @brief Whether the user can act on this error (grant access, plug in a
 * device, retry the call). Protocol and decode errors are internal.
 */
bool is_user_actionable(ErrorKind kind);

/**
 * @brief Whether this error blocks starting a call.
 */
bool is_fatal_to_call_start(ErrorKind kind);

}  // namespace loanvoice

#endif  // LOANVOICE_CORE_ERROR_H
