#include "daemon/http_tool_executor.hpp"
#include "common/http_client.hpp"
#include "common/logger.hpp"

namespace toolrelay::daemon {

namespace http = boost::beast::http;
namespace json = boost::json;

namespace {

auto& log() { return Logger::get("daemon.tools"); }

// Error text from a failed response body: {"detail": ...}, {"error": ...} or raw text.
std::string error_detail(const std::string& body) {
    boost::system::error_code ec;
    auto jv = json::parse(body, ec);
    if (!ec && jv.is_object()) {
        const auto& obj = jv.as_object();
        for (auto key : {"detail", "error", "message"}) {
            if (auto it = obj.find(key); it != obj.end()) {
                if (it->value().is_string()) return std::string(it->value().as_string());
                return json::serialize(it->value());
            }
        }
    }
    return body.size() > 512 ? body.substr(0, 512) : body;
}

} // anonymous namespace

std::string url_encode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

HttpToolExecutor::HttpToolExecutor(HttpToolExecutorConfig config)
    : config_(std::move(config)) {}

std::string HttpToolExecutor::base_url() const {
    return "http://" + config_.host + ":" + std::to_string(config_.port);
}

std::expected<json::value, ToolError> HttpToolExecutor::execute(
    const std::string& method,
    const json::object& params,
    std::chrono::milliseconds timeout) {

    HttpHeaders headers;
    if (!config_.auth_token.empty()) {
        headers.emplace_back("Authorization", "Bearer " + config_.auth_token);
    }

    HttpClientOptions options;
    options.timeout = timeout;

    auto url = base_url() + "/api/mcp/call?tool_name=" + url_encode(method);
    auto result = http_request(http::verb::post, url, json::serialize(params), headers, options);
    if (!result) {
        log().warn("Tool '{}' failed: local service unreachable: {}", method, result.error());
        return std::unexpected(ToolError{ErrorKind::TOOL_EXECUTION_FAILED,
                                         "local tool service unreachable: " + result.error()});
    }

    if (result->status == 404) {
        return std::unexpected(ToolError{ErrorKind::UNKNOWN_METHOD,
                                         "unknown tool: " + method});
    }
    if (result->status == 400 || result->status == 422) {
        return std::unexpected(ToolError{ErrorKind::INVALID_PARAMS, error_detail(result->body)});
    }
    if (result->status < 200 || result->status >= 300) {
        return std::unexpected(ToolError{
            ErrorKind::TOOL_EXECUTION_FAILED,
            "tool service returned " + std::to_string(result->status) + ": " +
                error_detail(result->body)});
    }

    if (result->body.empty()) {
        return json::value(nullptr);
    }

    boost::system::error_code ec;
    auto jv = json::parse(result->body, ec);
    if (ec) {
        // Non-JSON output is passed through as a string
        return json::value(json::string(result->body));
    }
    return jv;
}

json::array HttpToolExecutor::list_tools() {
    HttpHeaders headers;
    if (!config_.auth_token.empty()) {
        headers.emplace_back("Authorization", "Bearer " + config_.auth_token);
    }

    HttpClientOptions options;
    options.timeout = config_.list_timeout;

    auto result = http_request(http::verb::get, base_url() + "/api/mcp/tools", {}, headers, options);
    if (!result || result->status != 200) {
        log().warn("Failed to get tool list from local service: {}",
                   result ? "status " + std::to_string(result->status) : result.error());
        return {};
    }

    boost::system::error_code ec;
    auto jv = json::parse(result->body, ec);
    if (ec || !jv.is_object()) {
        log().warn("Tool list response is not a JSON object");
        return {};
    }
    if (auto it = jv.as_object().find("tools"); it != jv.as_object().end() && it->value().is_array()) {
        return it->value().as_array();
    }
    return {};
}

} // namespace toolrelay::daemon
