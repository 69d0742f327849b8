#pragma once

#include "daemon/tool_executor.hpp"
#include <cstdint>
#include <string>

namespace toolrelay::daemon {

struct HttpToolExecutorConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 37800;
    std::string auth_token;  // sent as "Authorization: Bearer" when set
    std::chrono::milliseconds list_timeout{5000};
};

// Calls the local daemon's MCP endpoints:
//   POST /api/mcp/call?tool_name=<name>   body = params
//   GET  /api/mcp/tools                   -> {"tools": [...]}
class HttpToolExecutor : public ToolExecutor {
public:
    explicit HttpToolExecutor(HttpToolExecutorConfig config);

    std::expected<boost::json::value, ToolError> execute(
        const std::string& method,
        const boost::json::object& params,
        std::chrono::milliseconds timeout) override;

    boost::json::array list_tools() override;

    std::string base_url() const;

private:
    HttpToolExecutorConfig config_;
};

// Percent-encode a query parameter value.
std::string url_encode(const std::string& value);

} // namespace toolrelay::daemon
