// =============================================================================
// URL helpers - Implementation
// =============================================================================

#include "loanvoice/network/url.h"

#include <regex>

namespace loanvoice {

bool parse_ws_url(const std::string& url, WsUrl& out, std::string& error) {
    std::regex url_regex(R"((ws|wss|http|https)://([^:/?#]+)(?::(\d+))?([/?].*)?)");
    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        error = "Invalid URL: " + url;
        return false;
    }

    out.scheme = match[1].str();
    out.host = match[2].str();

    if (match[3].matched) {
        // At most 5 digits keeps stoi in range
        const std::string port = match[3].str();
        int value = port.size() <= 5 ? std::stoi(port) : 0;
        if (value <= 0 || value > 65535) {
            error = "Invalid port in URL: " + url;
            return false;
        }
        out.port = value;
    } else {
        out.port = out.secure() ? 443 : 80;
    }

    std::string target = match[4].matched ? match[4].str() : "";
    if (target.empty()) {
        target = "/";
    } else if (target[0] == '?') {
        target = "/" + target;
    }
    out.target = target;
    return true;
}

std::string percent_encode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(value.size() * 3);
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }
    return result;
}

std::string append_query_param(const std::string& url, const std::string& key,
                               const std::string& value) {
    std::string base = url;
    std::string fragment;
    auto hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base.erase(hash);
    }

    char sep = '?';
    if (base.find('?') != std::string::npos) {
        sep = (base.back() == '?' || base.back() == '&') ? '\0' : '&';
    }

    std::string result = base;
    if (sep != '\0') result += sep;
    result += percent_encode(key) + "=" + percent_encode(value);
    return result + fragment;
}

}  // namespace loanvoice
