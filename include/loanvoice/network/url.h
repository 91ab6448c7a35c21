/**
 * @file url.h
 * @brief LoanVoice - WebSocket URL helpers
 */

#ifndef LOANVOICE_NETWORK_URL_H
#define LOANVOICE_NETWORK_URL_H

#include <string>

namespace loanvoice {

struct WsUrl {
    std::string scheme;  ///< "ws", "wss", "http" or "https"
    std::string host;
    int port = 80;
    std::string target = "/";  ///< Path plus query, always starts with '/'

    bool secure() const { return scheme == "wss" || scheme == "https"; }
};

/**
 * @brief Split a ws:// (or http://) URL. Default ports are 80 and 443.
 * @return false if the URL does not match scheme://host[:port][/target]
 */
bool parse_ws_url(const std::string& url, WsUrl& out, std::string& error);

// RFC 3986 percent-encoding; unreserved characters pass through
std::string percent_encode(const std::string& value);

/**
 * @brief Append `key=value` (value percent-encoded) to the URL's query.
 */
std::string append_query_param(const std::string& url, const std::string& key,
                               const std::string& value);

}  // namespace loanvoice

#endif  // LOANVOICE_NETWORK_URL_H
