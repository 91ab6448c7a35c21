#include "loanvoice/core/error.h"

namespace loanvoice {

// ------------------------------------------------------------
// Category strings
// ------------------------------------------------------------
const char* error_category(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "Success";
        case ErrorKind::Permission:
            return "Permission";
        case ErrorKind::Device:
            return "Device";
        case ErrorKind::Transport:
            return "Transport";
        case ErrorKind::Protocol:
            return "Protocol";
        case ErrorKind::Decode:
            return "Decode";
        case ErrorKind::Server:
            return "Server";
        case ErrorKind::Config:
            return "Config";
        case ErrorKind::Session:
            return "Session";
    }
    return "Unknown";
}

bool is_user_actionable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Permission:
        case ErrorKind::Device:
        case ErrorKind::Transport:
        case ErrorKind::Server:
        case ErrorKind::Config:
        case ErrorKind::Session:
            return true;
        default:
            return false;
    }
}

bool is_fatal_to_call_start(ErrorKind kind) {
    return kind == ErrorKind::Permission || kind == ErrorKind::Device;
}

std::string Error::to_string() const {
    if (ok()) {
        return "Success";
    }
    return std::string(error_category(kind)) + ": " + message;
}

}  // namespace loanvoice
