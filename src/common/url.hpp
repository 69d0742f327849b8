#pragma once

#include <optional>
#include <string>

namespace toolrelay {

struct UrlComponents {
    std::string scheme;  // http, https, ws or wss
    std::string host;
    std::string port;
    std::string path;    // always starts with '/'
    bool use_ssl{false};

    // host:port, omitting the default port for the scheme
    std::string host_header() const;
};

// Pattern: (http|https|ws|wss)://host[:port][/path]
std::optional<UrlComponents> parse_url(const std::string& url);

// Base URL with `suffix` appended to its path, without doubled slashes.
std::string append_path(const std::string& base_url, const std::string& suffix);

// WebSocket endpoint of an edge base URL: https -> wss, http -> ws, then "/ws".
// ws:// and wss:// URLs are returned unchanged.
std::optional<std::string> websocket_url(const std::string& base_url);

} // namespace toolrelay
