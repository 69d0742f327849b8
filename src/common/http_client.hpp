#pragma once

#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace toolrelay {

struct HttpResult {
    unsigned status = 0;
    std::string body;
};

struct HttpClientOptions {
    std::chrono::milliseconds timeout{10000};
    bool ssl_verify = true;
    std::string ssl_ca_file;
    std::string user_agent = "toolrelay/1.0";
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * Blocking HTTP(S) request over a private io_context.
 *
 * Any status code is a successful result; the error string describes
 * transport failures (resolve, connect, TLS, timeout).
 */
std::expected<HttpResult, std::string> http_request(
    boost::beast::http::verb method,
    const std::string& url,
    const std::string& body = {},
    const HttpHeaders& headers = {},
    const HttpClientOptions& options = {});

} // namespace toolrelay
