#include "edge/request_facade.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"
#include <algorithm>

namespace toolrelay::edge {

namespace json = boost::json;

namespace {

auto& log() { return Logger::get("edge.facade"); }

constexpr const char* kProjectPrefix = "/projects/";

// Agent-supplied id: string or integer, echoed back untouched
std::optional<json::value> agent_id(const json::object& obj) {
    auto it = obj.find("id");
    if (it == obj.end() || it->value().is_null()) {
        return std::nullopt;
    }
    if (it->value().is_string() || it->value().is_int64() || it->value().is_uint64()) {
        return it->value();
    }
    return std::nullopt;
}

json::object rpc_error(const json::value& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

json::object rpc_result(const json::value& id, json::value result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)},
    };
}

HttpResponse make_rpc_response(const json::object& body) {
    return make_json_response(http::status::ok, json::serialize(body));
}

} // anonymous namespace

// ============================================================================
// JSON Response Helpers
// ============================================================================

HttpResponse make_json_response(http::status status, const std::string& body) {
    HttpResponse res{status, 11};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse make_error_response(http::status status, const std::string& error,
                                 const std::string& reason, const std::string& message) {
    json::object body{
        {"error", error},
        {"reason", reason},
        {"message", message},
    };
    return make_json_response(status, json::serialize(body));
}

http::status status_for_error_kind(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UNAUTHORIZED:
        return http::status::unauthorized;
    case ErrorKind::OFFLINE:
        return http::status::service_unavailable;
    case ErrorKind::TIMEOUT:
    case ErrorKind::SUPERSEDED:
    case ErrorKind::DISCONNECTED:
    case ErrorKind::REVOKED:
        return http::status::gateway_timeout;
    case ErrorKind::CANCELLED:
        return http::status::request_timeout;
    case ErrorKind::TOOL_EXECUTION_FAILED:
    case ErrorKind::RESPONSE_TOO_LARGE:
        return http::status::ok;
    case ErrorKind::UNKNOWN_METHOD:
    case ErrorKind::INVALID_PARAMS:
        return http::status::bad_request;
    case ErrorKind::PROTOCOL_ERROR:
    case ErrorKind::CONNECTION_FAILED:
        return http::status::bad_gateway;
    }
    return http::status::internal_server_error;
}

HttpResponse make_relay_error_response(const RelayError& error) {
    std::string reason = is_tool_error(error.kind) ? "tool_error" : error_kind_name(error.kind);
    std::string message = error.message.empty() ? error_kind_name(error.kind) : error.message;
    return make_error_response(status_for_error_kind(error.kind), error_kind_name(error.kind),
                               reason, message);
}

std::string request_path(const HttpRequest& req) {
    std::string target(req.target());
    auto query_pos = target.find('?');
    return query_pos == std::string::npos ? target : target.substr(0, query_pos);
}

// ============================================================================
// HttpRouter Implementation
// ============================================================================

void HttpRouter::add_route(const std::string& method, const std::string& path, RouteHandler handler) {
    Route route;
    route.method = method;
    route.pattern = path;
    route.handler = std::move(handler);
    route.is_pattern = path.find(':') != std::string::npos;
    routes_.push_back(std::move(route));
}

std::pair<RouteHandler, std::string> HttpRouter::find_route(
    const std::string& method, const std::string& path) const {

    for (const auto& route : routes_) {
        if (route.method != method && route.method != "*") continue;

        std::string param;
        if (match(route, path, param)) {
            return {route.handler, param};
        }
    }

    return {nullptr, ""};
}

bool HttpRouter::has_path(const std::string& path) const {
    std::string param;
    return std::any_of(routes_.begin(), routes_.end(),
                       [&](const Route& route) { return match(route, path, param); });
}

bool HttpRouter::match(const Route& route, const std::string& path, std::string& param) const {
    if (route.is_pattern) {
        return match_pattern(route.pattern, path, param);
    }
    return route.pattern == path;
}

bool HttpRouter::match_pattern(const std::string& pattern, const std::string& path, std::string& param) const {
    // /projects/:id/relay -> /projects/abc/relay
    size_t colon_pos = pattern.find(':');
    if (colon_pos == std::string::npos) return false;

    std::string prefix = pattern.substr(0, colon_pos);
    if (path.compare(0, prefix.length(), prefix) != 0) return false;

    size_t suffix_pos = pattern.find('/', colon_pos);
    std::string suffix = suffix_pos == std::string::npos ? "" : pattern.substr(suffix_pos);

    std::string remaining = path.substr(prefix.length());
    size_t slash_pos = remaining.find('/');
    if (slash_pos == std::string::npos) {
        if (!suffix.empty()) return false;
        param = remaining;
    } else {
        if (remaining.substr(slash_pos) != suffix) return false;
        param = remaining.substr(0, slash_pos);
    }

    return !param.empty();
}

// ============================================================================
// RequestFacade
// ============================================================================

RequestFacade::RequestFacade(std::shared_ptr<SessionCoordinator> coordinator, FacadeOptions options)
    : coordinator_(std::move(coordinator))
    , options_(std::move(options))
{
    setup_routes();
}

void RequestFacade::add_project_route(
    const std::string& method, const std::string& suffix,
    std::function<net::awaitable<HttpResponse>(const HttpRequest&, const std::string&)> handler) {

    router_.add_route(method, std::string(kProjectPrefix) + ":id" + suffix, handler);
    router_.add_route(method, suffix,
        [this, handler](const HttpRequest& req, const std::string&) -> net::awaitable<HttpResponse> {
            if (options_.default_project.empty()) {
                co_return make_error_response(http::status::not_found, "not_found", "not_found",
                                              "no default project, use /projects/<id>" + request_path(req));
            }
            co_return co_await handler(req, options_.default_project);
        });
}

void RequestFacade::setup_routes() {
    add_project_route("POST", "/relay",
        [this](const HttpRequest& req, const std::string& project) { return handle_relay(req, project); });
    add_project_route("GET", "/health",
        [this](const HttpRequest& req, const std::string& project) { return handle_health(req, project); });
    add_project_route("GET", "/tools",
        [this](const HttpRequest& req, const std::string& project) { return handle_tools(req, project); });
    add_project_route("POST", "/mcp",
        [this](const HttpRequest& req, const std::string& project) { return handle_mcp(req, project); });
}

std::optional<std::string> RequestFacade::websocket_project(const std::string& path) const {
    if (path == "/ws") {
        if (options_.default_project.empty()) {
            return std::nullopt;
        }
        return options_.default_project;
    }

    std::string prefix = kProjectPrefix;
    const std::string suffix = "/ws";
    if (path.size() > prefix.size() + suffix.size() &&
        path.compare(0, prefix.size(), prefix) == 0 &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        auto id = path.substr(prefix.size(), path.size() - prefix.size() - suffix.size());
        if (id.find('/') == std::string::npos) {
            return id;
        }
    }
    return std::nullopt;
}

net::awaitable<HttpResponse> RequestFacade::handle(const HttpRequest& req) {
    auto path = request_path(req);

    if (req.method() == http::verb::options) {
        HttpResponse res{http::status::no_content, req.version()};
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        res.set(http::field::access_control_allow_headers, "Authorization, Content-Type, Mcp-Session-Id");
        res.set(http::field::access_control_max_age, "86400");
        res.prepare_payload();
        co_return res;
    }

    auto [handler, param] = router_.find_route(std::string(req.method_string()), path);
    if (!handler) {
        if (router_.has_path(path)) {
            co_return make_error_response(http::status::method_not_allowed, "method_not_allowed",
                                          "method_not_allowed",
                                          std::string(req.method_string()) + " not allowed on " + path);
        }
        co_return make_error_response(http::status::not_found, "not_found", "not_found",
                                      "no route for " + path);
    }

    auto res = co_await handler(req, param);
    res.version(req.version());
    res.set(http::field::server, options_.server_name);
    co_return res;
}

std::optional<HttpResponse> RequestFacade::authorize(const HttpRequest& req,
                                                     const std::string& project) const {
    auto header = req[http::field::authorization];
    auto token = crypto::extract_bearer_token(std::string_view(header.data(), header.size()));

    // Unknown projects get the same opaque answer as a bad token
    if (token.empty() || !coordinator_->authenticate_agent(project, token)) {
        log().info("Project '{}': rejected agent request to {}", project, request_path(req));
        return make_error_response(http::status::unauthorized, "unauthorized", "unauthorized",
                                   "missing or invalid agent token");
    }
    return std::nullopt;
}

net::awaitable<std::expected<wire::Frame, RelayError>> RequestFacade::relay_call(
    const std::string& project, const std::string& method,
    json::object params, std::chrono::milliseconds timeout) {

    auto executor = co_await net::this_coro::executor;
    auto routed = coordinator_->route_call(project, method, std::move(params), executor, timeout);
    if (!routed) {
        co_return std::unexpected(routed.error());
    }
    auto request = std::move(*routed);

    CallOutcome outcome;
    try {
        outcome = co_await request->wait();
    } catch (const boost::system::system_error& e) {
        outcome = std::unexpected(RelayError::make(ErrorKind::CANCELLED, e.code().message()));
    }

    if (!outcome) {
        auto kind = outcome.error().kind;
        if (kind == ErrorKind::TIMEOUT || kind == ErrorKind::CANCELLED) {
            // A late reply for this id is now dropped by the coordinator
            coordinator_->retire_pending(project, request->id(), outcome.error());
        }
        if (kind == ErrorKind::TIMEOUT) {
            log().warn("Project '{}': call {} ({}) timed out after {}ms",
                       project, request->id(), method, timeout.count());
        } else {
            log().info("Project '{}': call {} ({}) ended: {}",
                       project, request->id(), method, error_kind_name(kind));
        }
    }
    co_return outcome;
}

// ============================================================================
// Route handlers
// ============================================================================

net::awaitable<HttpResponse> RequestFacade::handle_relay(const HttpRequest& req,
                                                         const std::string& project) {
    if (auto denied = authorize(req, project)) {
        co_return std::move(*denied);
    }

    boost::system::error_code ec;
    auto body = json::parse(req.body(), ec);
    if (ec || !body.is_object()) {
        co_return make_error_response(http::status::bad_request, "bad_request", "bad_request",
                                      "body must be a JSON object");
    }
    const auto& obj = body.as_object();

    auto method_it = obj.find("method");
    if (method_it == obj.end() || !method_it->value().is_string() ||
        method_it->value().as_string().empty()) {
        co_return make_error_response(http::status::bad_request, "bad_request", "bad_request",
                                      "'method' must be a non-empty string");
    }
    std::string method(method_it->value().as_string());

    json::object params;
    if (auto it = obj.find("params"); it != obj.end() && !it->value().is_null()) {
        if (!it->value().is_object()) {
            co_return make_error_response(http::status::bad_request, "bad_request", "bad_request",
                                          "'params' must be an object");
        }
        params = it->value().as_object();
    }

    auto timeout = options_.request_timeout;
    if (auto it = obj.find("timeout_ms"); it != obj.end() && !it->value().is_null()) {
        auto ms = it->value().to_number<int64_t>(ec);
        if (ec || ms <= 0) {
            co_return make_error_response(http::status::bad_request, "bad_request", "bad_request",
                                          "'timeout_ms' must be a positive integer");
        }
        timeout = std::min(timeout, std::chrono::milliseconds(ms));
    }

    auto id = agent_id(obj);

    auto outcome = co_await relay_call(project, method, std::move(params), timeout);
    if (!outcome) {
        co_return make_relay_error_response(outcome.error());
    }

    json::object result;
    if (id) {
        result["id"] = *id;
    }

    if (auto* response = std::get_if<wire::ResponseFrame>(&*outcome)) {
        if (!id) {
            result["id"] = response->id;
        }
        result["result"] = std::move(response->result);
        co_return make_json_response(http::status::ok, json::serialize(result));
    }

    if (auto* error = std::get_if<wire::ErrorFrame>(&*outcome)) {
        if (!id) {
            result["id"] = error->id;
        }
        result["error"] = error_kind_name(error->kind);
        result["reason"] = is_tool_error(error->kind) ? "tool_error" : error_kind_name(error->kind);
        result["message"] = error->message;
        co_return make_json_response(status_for_error_kind(error->kind), json::serialize(result));
    }

    co_return make_relay_error_response(
        RelayError::make(ErrorKind::PROTOCOL_ERROR, "unexpected reply frame"));
}

net::awaitable<HttpResponse> RequestFacade::handle_health(const HttpRequest&,
                                                          const std::string& project) {
    if (!coordinator_->has_project(project)) {
        co_return make_error_response(http::status::not_found, "not_found", "not_found",
                                      "unknown project");
    }

    bool online = coordinator_->is_online(project);
    json::object body{
        {"status", "ok"},
        {"project", project},
        {"online", online},
        {"instance_connected", online},
    };
    co_return make_json_response(http::status::ok, json::serialize(body));
}

net::awaitable<HttpResponse> RequestFacade::handle_tools(const HttpRequest& req,
                                                         const std::string& project) {
    if (auto denied = authorize(req, project)) {
        co_return std::move(*denied);
    }

    json::object body{
        {"online", coordinator_->is_online(project)},
        {"tools", coordinator_->tools(project)},
    };
    co_return make_json_response(http::status::ok, json::serialize(body));
}

net::awaitable<HttpResponse> RequestFacade::handle_mcp(const HttpRequest& req,
                                                       const std::string& project) {
    if (auto denied = authorize(req, project)) {
        co_return std::move(*denied);
    }

    boost::system::error_code ec;
    auto body = json::parse(req.body(), ec);
    if (ec) {
        co_return make_rpc_response(rpc_error(nullptr, -32700, "parse error"));
    }
    if (!body.is_object()) {
        co_return make_rpc_response(rpc_error(nullptr, -32600, "invalid JSON-RPC request"));
    }
    const auto& rpc = body.as_object();

    json::value id = nullptr;
    if (auto it = rpc.find("id"); it != rpc.end()) {
        id = it->value();
    }

    auto version = rpc.find("jsonrpc");
    auto method_it = rpc.find("method");
    if (version == rpc.end() || !version->value().is_string() || version->value().as_string() != "2.0" ||
        method_it == rpc.end() || !method_it->value().is_string()) {
        co_return make_rpc_response(rpc_error(id, -32600, "invalid JSON-RPC request"));
    }
    std::string method(method_it->value().as_string());

    // Notifications carry no id and get no body
    if (method.starts_with("notifications/")) {
        HttpResponse res{http::status::accepted, 11};
        res.set(http::field::access_control_allow_origin, "*");
        res.prepare_payload();
        co_return res;
    }

    json::object params;
    if (auto it = rpc.find("params"); it != rpc.end() && it->value().is_object()) {
        params = it->value().as_object();
    }

    if (method == "initialize") {
        json::object result{
            {"protocolVersion", MCP_PROTOCOL_VERSION},
            {"capabilities", {{"tools", {{"listChanged", false}}}}},
            {"serverInfo", {{"name", options_.server_name}, {"version", "1.0.0"}}},
        };
        co_return make_rpc_response(rpc_result(id, std::move(result)));
    }

    if (method == "ping") {
        co_return make_rpc_response(rpc_result(id, json::object{}));
    }

    if (method == "tools/list") {
        co_return make_rpc_response(rpc_result(id, json::object{{"tools", coordinator_->tools(project)}}));
    }

    if (method == "tools/call") {
        auto name_it = params.find("name");
        if (name_it == params.end() || !name_it->value().is_string() ||
            name_it->value().as_string().empty()) {
            co_return make_rpc_response(rpc_error(id, -32602, "missing required parameter: name"));
        }
        std::string tool(name_it->value().as_string());

        json::object arguments;
        if (auto it = params.find("arguments"); it != params.end() && it->value().is_object()) {
            arguments = it->value().as_object();
        }

        auto outcome = co_await relay_call(project, tool, std::move(arguments), options_.request_timeout);
        if (!outcome) {
            co_return make_rpc_response(rpc_error(id, -32000, error_kind_name(outcome.error().kind) +
                std::string(": ") + (outcome.error().message.empty() ? "relay failure" : outcome.error().message)));
        }
        if (auto* error = std::get_if<wire::ErrorFrame>(&*outcome)) {
            co_return make_rpc_response(rpc_error(id, -32000,
                std::string(error_kind_name(error->kind)) + ": " + error->message));
        }
        if (auto* response = std::get_if<wire::ResponseFrame>(&*outcome)) {
            json::object result{
                {"content", json::array{json::object{
                    {"type", "text"},
                    {"text", json::serialize(response->result)},
                }}},
            };
            co_return make_rpc_response(rpc_result(id, std::move(result)));
        }
        co_return make_rpc_response(rpc_error(id, -32000, "unexpected reply frame"));
    }

    co_return make_rpc_response(rpc_error(id, -32601, "method not found: " + method));
}

} // namespace toolrelay::edge
