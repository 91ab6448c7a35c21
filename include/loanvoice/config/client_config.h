/**
 * @file client_config.h
 * @brief LoanVoice - Client configuration
 *
 * Sources, lowest to highest precedence:
 *   1. Built-in defaults
 *   2. JSON config file (--config <path>)
 *   3. Environment: LOANVOICE_URL, LOANVOICE_TOKEN
 *   4. Command-line flags
 *
 * Example config file:
 * @code
 * {
 *   "server_url": "ws://localhost:8000/api/voice/stream",
 *   "notification_url": "ws://localhost:8000/ws/notifications",
 *   "token_file": "~/.loanvoice/session.json",
 *   "log_level": "info",
 *   "capture":  { "device": "default", "gain": 5.0, "frame_samples": 2048, "encoding": "pcm16le" },
 *   "playback": { "device": "default" },
 *   "notifications": { "max_attempts": 5, "base_delay_ms": 1000, "max_delay_ms": 30000 }
 * }
 * @endcode
 */

#ifndef LOANVOICE_CONFIG_CLIENT_CONFIG_H
#define LOANVOICE_CONFIG_CLIENT_CONFIG_H

#include <string>

#include "loanvoice/audio/audio_output.h"
#include "loanvoice/core/error.h"
#include "loanvoice/core/logger.h"
#include "loanvoice/network/reconnect_policy.h"
#include "loanvoice/protocol/control_message.h"
#include "loanvoice/session/voice_session.h"

namespace loanvoice {

static constexpr const char* kDefaultServerUrl = "ws://localhost:8000/api/voice/stream";
static constexpr const char* kUrlEnvVar = "LOANVOICE_URL";
static constexpr const char* kTokenEnvVar = "LOANVOICE_TOKEN";

// Accepted frame window
static constexpr uint32_t kMinFrameMs = 64;
static constexpr uint32_t kMaxFrameMs = 500;

struct ClientConfig {
    SessionConfig session;  ///< Server URL, capture graph, debug_log cadence
    OutputDeviceConfig playback = OutputDeviceConfig::defaults();

    std::string notification_url;  ///< Empty disables the side channel
    ReconnectPolicy notification_reconnect = ReconnectPolicy::side_channel();

    std::string token;       ///< Explicit token (env or --token)
    std::string token_file;  ///< Session store file
    std::string token_env = kTokenEnvVar;

    int connect_timeout_ms = 5000;
    LogLevel log_level = LogLevel::Info;

    // Command-line only
    std::string config_file;
    bool list_devices = false;
    bool start_call = false;  ///< Start a call as soon as the channel opens
    bool show_help = false;
};

/**
 * @brief Apply a parsed JSON document. Unknown keys are ignored; wrongly
 * typed values are Config errors.
 */
bool apply_json(const Json& doc, ClientConfig& config, Error& error);

bool load_config_file(const std::string& path, ClientConfig& config, Error& error);

// LOANVOICE_URL overrides server_url, LOANVOICE_TOKEN sets token
void apply_environment(ClientConfig& config);

bool parse_args(int argc, char* argv[], ClientConfig& config, Error& error);

bool validate(const ClientConfig& config, Error& error);

/**
 * @brief Defaults, then --config file, then environment, then flags, then
 * validate().
 */
bool load_client_config(int argc, char* argv[], ClientConfig& config, Error& error);

void print_usage(const char* prog_name);

}  // namespace loanvoice

#endif  // LOANVOICE_CONFIG_CLIENT_CONFIG_H
