/**
 * @file logger.cpp
 * @brief LoanVoice - Logger implementation
 */

#include "loanvoice/core/logger.h"

#include <algorithm>
#include <cctype>

namespace loanvoice {

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        out = LogLevel::Trace;
    } else if (lower == "debug") {
        out = LogLevel::Debug;
    } else if (lower == "info") {
        out = LogLevel::Info;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::Warning;
    } else if (lower == "error") {
        out = LogLevel::Error;
    } else if (lower == "fatal") {
        out = LogLevel::Fatal;
    } else {
        return false;
    }
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Fatal:
            return "FATAL";
        default:
            return "???";
    }
}

void Logger::log(LogLevel level, const char* category, const char* format, ...) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(min_level_)) {
            return;
        }
    }

    // Format the message
    char buffer[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    // Route to callback or fallback
    std::lock_guard<std::mutex> lock(mutex_);
    if (callback_) {
        callback_(level, category, buffer, user_data_);
    } else if (stderr_fallback_) {
        logToStderr(level, category, buffer);
    }
}

void Logger::logToStderr(LogLevel level, const char* category, const char* message) {
    FILE* stream = (level >= LogLevel::Error) ? stderr : stdout;
    fprintf(stream, "[%s][%s] %s\n", log_level_name(level), category, message);
    fflush(stream);
}

}  // namespace loanvoice
