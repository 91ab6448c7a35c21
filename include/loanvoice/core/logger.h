/**
 * @file logger.h
 * @brief LoanVoice - Internal Logger
 *
 * Simple logging utilities for the voice client that can be optionally
 * connected to an external logging system (e.g. the host application).
 *
 * Usage:
 *   LV_LOG_INFO("Transport", "Connected to %s", url.c_str());
 *   LV_LOG_ERROR("Playback", "Decode failed: %s", error.c_str());
 */

#ifndef LOANVOICE_CORE_LOGGER_H
#define LOANVOICE_CORE_LOGGER_H

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace loanvoice {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4, Fatal = 5 };

/**
 * Parse a level name ("trace", "debug", "info", "warn"/"warning", "error",
 * "fatal"), case-insensitive.
 *
 * @return false if the name is not recognised (out is left untouched)
 */
bool parse_log_level(const std::string& name, LogLevel& out);

const char* log_level_name(LogLevel level);

// =============================================================================
// LOG CALLBACK TYPE
// =============================================================================

/**
 * External log callback type.
 * Set this to route logs to the host's logging system.
 *
 * @param level Log level
 * @param category Log category (e.g., "Transport")
 * @param message Formatted message
 * @param user_data Optional user context
 */
using LogCallback = void (*)(LogLevel level, const char* category, const char* message,
                             void* user_data);

// =============================================================================
// LOGGER CLASS
// =============================================================================

class Logger {
   public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Set external callback for routing logs
    void setCallback(LogCallback callback, void* user_data = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = callback;
        user_data_ = user_data;
    }

    // Set minimum log level
    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel minLevel() {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    // Enable/disable stderr fallback
    void setStderrFallback(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        stderr_fallback_ = enabled;
    }

    // Core log function
    void log(LogLevel level, const char* category, const char* format, ...)
        __attribute__((format(printf, 4, 5)));

   private:
    Logger() = default;

    void logToStderr(LogLevel level, const char* category, const char* message);

    std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Info;
    bool stderr_fallback_ = true;
};

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define LV_LOG_TRACE(category, ...) \
    loanvoice::Logger::instance().log(loanvoice::LogLevel::Trace, category, __VA_ARGS__)

#define LV_LOG_DEBUG(category, ...) \
    loanvoice::Logger::instance().log(loanvoice::LogLevel::Debug, category, __VA_ARGS__)

#define LV_LOG_INFO(category, ...) \
    loanvoice::Logger::instance().log(loanvoice::LogLevel::Info, category, __VA_ARGS__)

#define LV_LOG_WARNING(category, ...) \
    loanvoice::Logger::instance().log(loanvoice::LogLevel::Warning, category, __VA_ARGS__)

#define LV_LOG_ERROR(category, ...) \
    loanvoice::Logger::instance().log(loanvoice::LogLevel::Error, category, __VA_ARGS__)

#define LV_LOG_FATAL(category, ...) \
    loanvoice::Logger::instance().log(loanvoice::LogLevel::Fatal, category, __VA_ARGS__)

}  // namespace loanvoice

#endif  // LOANVOICE_CORE_LOGGER_H
