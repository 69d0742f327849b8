#include "common/url.hpp"
#include <cctype>
#include <regex>

namespace toolrelay {

std::string UrlComponents::host_header() const {
    bool default_port = (use_ssl && port == "443") || (!use_ssl && port == "80");
    return default_port ? host : host + ":" + port;
}

std::optional<UrlComponents> parse_url(const std::string& url) {
    static const std::regex url_regex(R"(^(https?|wss?)://([^:/?#]+)(?::(\d{1,5}))?(/[^#]*)?$)",
                                      std::regex::icase);
    std::smatch match;

    if (!std::regex_match(url, match, url_regex)) {
        return std::nullopt;
    }

    UrlComponents parts;
    parts.scheme = match[1].str();
    for (auto& c : parts.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    parts.use_ssl = (parts.scheme == "https" || parts.scheme == "wss");
    parts.host = match[2].str();
    parts.port = match[3].matched ? match[3].str() : (parts.use_ssl ? "443" : "80");
    parts.path = match[4].matched ? match[4].str() : "/";

    if (std::stoul(parts.port) == 0 || std::stoul(parts.port) > 65535) {
        return std::nullopt;
    }
    return parts;
}

std::string append_path(const std::string& base_url, const std::string& suffix) {
    std::string result = base_url;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (suffix.empty() || suffix.front() != '/') {
        result += '/';
    }
    return result + suffix;
}

std::optional<std::string> websocket_url(const std::string& base_url) {
    auto parts = parse_url(base_url);
    if (!parts) {
        return std::nullopt;
    }
    if (parts->scheme == "ws" || parts->scheme == "wss") {
        return base_url;
    }

    std::string rest = base_url.substr(parts->scheme.size());  // "://host..."
    std::string scheme = parts->use_ssl ? "wss" : "ws";
    return append_path(scheme + rest, "/ws");
}

} // namespace toolrelay
