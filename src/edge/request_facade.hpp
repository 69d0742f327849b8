#pragma once

#include "common/config.hpp"
#include "common/error.hpp"
#include "edge/session_coordinator.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolrelay::edge {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

// ============================================================================
// HTTP Request Handler Types
// ============================================================================

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;
using RouteHandler = std::function<net::awaitable<HttpResponse>(const HttpRequest&, const std::string&)>;

// MCP protocol revision spoken on /mcp
inline constexpr const char* MCP_PROTOCOL_VERSION = "2025-03-26";

// ============================================================================
// HTTP Router
// ============================================================================

class HttpRouter {
public:
    void add_route(const std::string& method, const std::string& path, RouteHandler handler);

    // Handler and the value of the pattern's :param, or nullptr
    std::pair<RouteHandler, std::string> find_route(const std::string& method, const std::string& path) const;

    // True when some route matches `path` under any method
    bool has_path(const std::string& path) const;

private:
    struct Route {
        std::string method;
        std::string pattern;
        RouteHandler handler;
        bool is_pattern{false};  // Has a path parameter like :id
    };

    std::vector<Route> routes_;

    bool match(const Route& route, const std::string& path, std::string& param) const;
    bool match_pattern(const std::string& pattern, const std::string& path, std::string& param) const;
};

// ============================================================================
// JSON Response Helpers
// ============================================================================

HttpResponse make_json_response(http::status status, const std::string& body);
HttpResponse make_error_response(http::status status, const std::string& error,
                                 const std::string& reason, const std::string& message);

// Status and body for a failed relay call
HttpResponse make_relay_error_response(const RelayError& error);

// Status for an Error frame returned by the daemon
http::status status_for_error_kind(ErrorKind kind);

// Path without query string
std::string request_path(const HttpRequest& req);

// ============================================================================
// Request Façade
// ============================================================================

struct FacadeOptions {
    std::string default_project;  // served on unprefixed paths, empty = none
    std::string server_name = "toolrelay";
    std::chrono::milliseconds request_timeout{30000};
};

/**
 * RequestFacade - turns agent HTTP requests into relayed calls.
 *
 * Routes:
 *   POST /relay            relay one tool call
 *   GET  /health           unauthenticated liveness check
 *   GET  /tools            cached tool advertisement
 *   POST /mcp              MCP JSON-RPC (initialize, tools/list, tools/call)
 *   OPTIONS *              CORS preflight
 *
 * Each route also exists as /projects/:id/<route>. The unprefixed form
 * serves the default project.
 *
 * handle() suspends while the daemon works. Cancelling the awaiting
 * coroutine (the HTTP client went away) retires the pending call.
 */
class RequestFacade {
public:
    RequestFacade(std::shared_ptr<SessionCoordinator> coordinator, FacadeOptions options);

    net::awaitable<HttpResponse> handle(const HttpRequest& req);

    // Project whose WebSocket endpoint `path` is (/ws or /projects/:id/ws)
    std::optional<std::string> websocket_project(const std::string& path) const;

    const FacadeOptions& options() const { return options_; }

private:
    void setup_routes();

    // Route a path both unprefixed and under /projects/:id
    void add_project_route(const std::string& method, const std::string& suffix,
                           std::function<net::awaitable<HttpResponse>(const HttpRequest&,
                                                                      const std::string& project)> handler);

    net::awaitable<HttpResponse> handle_relay(const HttpRequest& req, const std::string& project);
    net::awaitable<HttpResponse> handle_health(const HttpRequest& req, const std::string& project);
    net::awaitable<HttpResponse> handle_tools(const HttpRequest& req, const std::string& project);
    net::awaitable<HttpResponse> handle_mcp(const HttpRequest& req, const std::string& project);

    // Checks the agent token; nullopt when the caller may proceed
    std::optional<HttpResponse> authorize(const HttpRequest& req, const std::string& project) const;

    // Route a call and wait for its outcome, retiring it if we stop waiting
    net::awaitable<std::expected<wire::Frame, RelayError>> relay_call(
        const std::string& project, const std::string& method,
        boost::json::object params, std::chrono::milliseconds timeout);

    std::shared_ptr<SessionCoordinator> coordinator_;
    FacadeOptions options_;
    HttpRouter router_;
};

} // namespace toolrelay::edge
