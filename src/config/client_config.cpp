// =============================================================================
// Client Configuration - Implementation
// =============================================================================

#include "loanvoice/config/client_config.h"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>

#include "loanvoice/network/url.h"

namespace loanvoice {

// =============================================================================
// JSON helpers
// =============================================================================

namespace {

std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return std::string(home) + path.substr(1);
    }
    return path;
}

// Absent key: untouched, true. Present with the wrong type: Config error.
template <typename T>
bool read_field(const Json& obj, const char* key, T& out, Error& error) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return true;
    try {
        out = it->get<T>();
        return true;
    } catch (const std::exception& e) {
        error = make_error(ErrorKind::Config, std::string("Invalid value for '") + key +
                                                  "': " + e.what());
        return false;
    }
}

bool read_section(const Json& doc, const char* key, const Json*& out, Error& error) {
    out = nullptr;
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return true;
    if (!it->is_object()) {
        error = make_error(ErrorKind::Config, std::string("'") + key + "' must be an object");
        return false;
    }
    out = &*it;
    return true;
}

bool read_log_level(const std::string& name, LogLevel& out, Error& error) {
    if (!parse_log_level(name, out)) {
        error = make_error(ErrorKind::Config, "Unknown log level: " + name);
        return false;
    }
    return true;
}

bool read_encoding(const std::string& name, EncodingMode& out, Error& error) {
    if (!parse_encoding_mode(name, out)) {
        error = make_error(ErrorKind::Config, "Unknown encoding: " + name +
                                                  " (expected pcm16le or wav)");
        return false;
    }
    return true;
}

}  // namespace

bool apply_json(const Json& doc, ClientConfig& config, Error& error) {
    if (!doc.is_object()) {
        error = make_error(ErrorKind::Config, "Config root must be a JSON object");
        return false;
    }

    std::string log_level;
    if (!read_field(doc, "server_url", config.session.server_url, error) ||
        !read_field(doc, "notification_url", config.notification_url, error) ||
        !read_field(doc, "token_file", config.token_file, error) ||
        !read_field(doc, "token_env", config.token_env, error) ||
        !read_field(doc, "connect_timeout_ms", config.connect_timeout_ms, error) ||
        !read_field(doc, "log_level", log_level, error)) {
        return false;
    }
    if (!log_level.empty() && !read_log_level(log_level, config.log_level, error)) {
        return false;
    }
    config.token_file = expand_home(config.token_file);

    const Json* capture = nullptr;
    if (!read_section(doc, "capture", capture, error)) return false;
    if (capture) {
        CaptureGraphConfig& c = config.session.capture;
        std::string encoding;
        if (!read_field(*capture, "device", c.device.device, error) ||
            !read_field(*capture, "sample_rate", c.device.sample_rate, error) ||
            !read_field(*capture, "period_frames", c.device.period_frames, error) ||
            !read_field(*capture, "buffer_frames", c.device.buffer_frames, error) ||
            !read_field(*capture, "echo_cancellation", c.device.echo_cancellation, error) ||
            !read_field(*capture, "noise_suppression", c.device.noise_suppression, error) ||
            !read_field(*capture, "frame_samples", c.frame_samples, error) ||
            !read_field(*capture, "gain", c.gain, error) ||
            !read_field(*capture, "encoding", encoding, error) ||
            !read_field(*capture, "debug_log_interval_frames",
                        config.session.debug_log_interval_frames, error)) {
            return false;
        }
        if (!encoding.empty() && !read_encoding(encoding, c.encoding, error)) {
            return false;
        }
    }

    const Json* playback = nullptr;
    if (!read_section(doc, "playback", playback, error)) return false;
    if (playback) {
        if (!read_field(*playback, "device", config.playback.device, error) ||
            !read_field(*playback, "period_frames", config.playback.period_frames, error) ||
            !read_field(*playback, "buffer_frames", config.playback.buffer_frames, error)) {
            return false;
        }
    }

    const Json* notifications = nullptr;
    if (!read_section(doc, "notifications", notifications, error)) return false;
    if (notifications) {
        ReconnectPolicy& p = config.notification_reconnect;
        if (!read_field(*notifications, "auto_reconnect", p.auto_reconnect, error) ||
            !read_field(*notifications, "max_attempts", p.max_attempts, error) ||
            !read_field(*notifications, "base_delay_ms", p.base_delay_ms, error) ||
            !read_field(*notifications, "max_delay_ms", p.max_delay_ms, error)) {
            return false;
        }
    }

    return true;
}

bool load_config_file(const std::string& path, ClientConfig& config, Error& error) {
    std::ifstream file(expand_home(path));
    if (!file.is_open()) {
        error = make_error(ErrorKind::Config, "Cannot open config file: " + path);
        return false;
    }

    Json doc;
    try {
        doc = Json::parse(file);
    } catch (const std::exception& e) {
        error = make_error(ErrorKind::Config, "Cannot parse " + path + ": " + e.what());
        return false;
    }

    if (!apply_json(doc, config, error)) {
        error.message = path + ": " + error.message;
        return false;
    }
    LV_LOG_DEBUG("Config", "Loaded %s", path.c_str());
    return true;
}

void apply_environment(ClientConfig& config) {
    const char* url = std::getenv(kUrlEnvVar);
    if (url && *url) {
        config.session.server_url = url;
    }
    const char* token = std::getenv(kTokenEnvVar);
    if (token && *token) {
        config.token = token;
    }
}

// =============================================================================
// Command Line Arguments
// =============================================================================

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>          JSON config file\n"
              << "  --url <url>              Voice stream URL (default: \"" << kDefaultServerUrl << "\")\n"
              << "  --notify-url <url>       Notifications channel URL (default: disabled)\n"
              << "  --token <token>          Bearer token (default: $" << kTokenEnvVar << ")\n"
              << "  --token-file <path>      Session store file holding the token\n"
              << "  --input <device>         Audio input device (default: \"default\")\n"
              << "  --output <device>        Audio output device (default: \"default\")\n"
              << "  --sample-rate <hz>       Capture sample rate (default: 16000)\n"
              << "  --frame-samples <n>      Samples per outbound frame (default: 2048)\n"
              << "  --gain <f>               Microphone gain (default: 5.0)\n"
              << "  --encoding <mode>        pcm16le or wav (default: pcm16le)\n"
              << "  --debug-log-every <n>    Mic level report every n frames, 0 = off (default: 40)\n"
              << "  --call                   Start a call as soon as the channel opens\n"
              << "  --log-level <level>      trace, debug, info, warning, error (default: info)\n"
              << "  --debug                  Same as --log-level debug\n"
              << "  --list-devices           List available audio devices\n"
              << "  --help                   Show this help message\n\n"
              << "Commands (stdin):\n"
              << "  /call                    Start or end the call\n"
              << "  /new                     Start a new chat\n"
              << "  /upload <type>           Report a document upload (aadhaar, pan, kyc, bank, salary)\n"
              << "  /verified                Report documents verified\n"
              << "  /done                    Report verification completed\n"
              << "  /proceed <id>            Continue to verification with an application id\n"
              << "  /quit                    Exit\n"
              << "  <text>                   Send a typed message\n"
              << std::endl;
}

bool parse_args(int argc, char* argv[], ClientConfig& config, Error& error) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        try {
            if (strcmp(arg, "--config") == 0 && has_value) {
                config.config_file = argv[++i];
            } else if (strcmp(arg, "--url") == 0 && has_value) {
                config.session.server_url = argv[++i];
            } else if (strcmp(arg, "--notify-url") == 0 && has_value) {
                config.notification_url = argv[++i];
            } else if (strcmp(arg, "--token") == 0 && has_value) {
                config.token = argv[++i];
            } else if (strcmp(arg, "--token-file") == 0 && has_value) {
                config.token_file = expand_home(argv[++i]);
            } else if (strcmp(arg, "--input") == 0 && has_value) {
                config.session.capture.device.device = argv[++i];
            } else if (strcmp(arg, "--output") == 0 && has_value) {
                config.playback.device = argv[++i];
            } else if (strcmp(arg, "--sample-rate") == 0 && has_value) {
                config.session.capture.device.sample_rate =
                    static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (strcmp(arg, "--frame-samples") == 0 && has_value) {
                config.session.capture.frame_samples = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (strcmp(arg, "--gain") == 0 && has_value) {
                config.session.capture.gain = std::stof(argv[++i]);
            } else if (strcmp(arg, "--encoding") == 0 && has_value) {
                if (!read_encoding(argv[++i], config.session.capture.encoding, error)) return false;
            } else if (strcmp(arg, "--debug-log-every") == 0 && has_value) {
                config.session.debug_log_interval_frames =
                    static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (strcmp(arg, "--log-level") == 0 && has_value) {
                if (!read_log_level(argv[++i], config.log_level, error)) return false;
            } else if (strcmp(arg, "--debug") == 0) {
                config.log_level = LogLevel::Debug;
            } else if (strcmp(arg, "--call") == 0) {
                config.start_call = true;
            } else if (strcmp(arg, "--list-devices") == 0) {
                config.list_devices = true;
            } else if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
                config.show_help = true;
            } else {
                error = make_error(ErrorKind::Config, std::string("Unknown or incomplete option: ") + arg);
                return false;
            }
        } catch (const std::exception& e) {
            error = make_error(ErrorKind::Config,
                               std::string("Invalid number for ") + arg + ": " + argv[i]);
            return false;
        }
    }
    return true;
}

// =============================================================================
// Validation
// =============================================================================

static bool validate_url(const std::string& url, const char* what, Error& error) {
    WsUrl parsed;
    std::string reason;
    if (!parse_ws_url(url, parsed, reason)) {
        error = make_error(ErrorKind::Config, std::string(what) + ": " + reason);
        return false;
    }
    if (parsed.secure()) {
        error = make_error(ErrorKind::Config, std::string(what) +
                                                  ": TLS is not supported; use a ws:// URL");
        return false;
    }
    return true;
}

bool validate(const ClientConfig& config, Error& error) {
    if (!validate_url(config.session.server_url, "server_url", error)) return false;
    if (!config.notification_url.empty() &&
        !validate_url(config.notification_url, "notification_url", error)) {
        return false;
    }

    const CaptureGraphConfig& capture = config.session.capture;
    if (capture.device.sample_rate == 0) {
        error = make_error(ErrorKind::Config, "sample_rate must be non-zero");
        return false;
    }
    uint32_t frame_ms = capture.frame_ms();
    if (capture.frame_samples == 0 || frame_ms < kMinFrameMs || frame_ms > kMaxFrameMs) {
        error = make_error(ErrorKind::Config,
                           "frame_samples gives a " + std::to_string(frame_ms) +
                               " ms frame; expected " + std::to_string(kMinFrameMs) + "-" +
                               std::to_string(kMaxFrameMs) + " ms");
        return false;
    }
    if (!(capture.gain > 0.0f)) {
        error = make_error(ErrorKind::Config, "gain must be positive");
        return false;
    }
    if (config.connect_timeout_ms <= 0) {
        error = make_error(ErrorKind::Config, "connect_timeout_ms must be positive");
        return false;
    }
    if (config.notification_reconnect.auto_reconnect &&
        config.notification_reconnect.max_attempts < 0) {
        error = make_error(ErrorKind::Config, "notifications.max_attempts must not be negative");
        return false;
    }
    return true;
}

bool load_client_config(int argc, char* argv[], ClientConfig& config, Error& error) {
    config = ClientConfig{};

    // First pass only to find --config
    ClientConfig flags;
    if (!parse_args(argc, argv, flags, error)) {
        return false;
    }
    if (!flags.config_file.empty() && !load_config_file(flags.config_file, config, error)) {
        return false;
    }

    apply_environment(config);

    if (!parse_args(argc, argv, config, error)) {
        return false;
    }
    if (config.show_help || config.list_devices) {
        return true;
    }
    return validate(config, error);
}

}  // namespace loanvoice
