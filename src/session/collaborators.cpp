// =============================================================================
// Collaborators - Token providers
// =============================================================================

#include "loanvoice/session/collaborators.h"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <sstream>

#include "loanvoice/core/logger.h"

namespace loanvoice {

static std::string trim_copy(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    return s.substr(start, s.find_last_not_of(ws) - start + 1);
}

SessionStoreTokenProvider::SessionStoreTokenProvider(std::string path, std::string env_var)
    : path_(std::move(path)), env_var_(std::move(env_var)) {}

std::string SessionStoreTokenProvider::token() {
    if (!path_.empty()) {
        std::ifstream file(path_);
        if (file.is_open()) {
            std::stringstream ss;
            ss << file.rdbuf();
            std::string content = trim_copy(ss.str());

            if (!content.empty() && content[0] == '{') {
                try {
                    Json store = Json::parse(content);
                    for (const char* key : {"token", "access_token"}) {
                        auto it = store.find(key);
                        if (it != store.end() && it->is_string()) {
                            return it->get<std::string>();
                        }
                    }
                    LV_LOG_WARNING("Session", "Session store %s has no token", path_.c_str());
                } catch (const std::exception& e) {
                    LV_LOG_WARNING("Session", "Cannot parse session store %s: %s", path_.c_str(),
                                   e.what());
                }
            } else if (!content.empty()) {
                return content;
            }
        }
    }

    if (!env_var_.empty()) {
        const char* value = std::getenv(env_var_.c_str());
        if (value && *value) {
            return value;
        }
    }
    return "";
}

}  // namespace loanvoice
