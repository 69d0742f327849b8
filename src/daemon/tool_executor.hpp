#pragma once

#include "common/error.hpp"
#include <boost/json.hpp>
#include <chrono>
#include <expected>
#include <string>

namespace toolrelay::daemon {

struct ToolError {
    ErrorKind kind{ErrorKind::TOOL_EXECUTION_FAILED};
    std::string message;
};

/**
 * ToolExecutor - the local tool-execution service.
 *
 * Implementations may block; the dispatcher calls them from worker threads
 * and may call them concurrently for different requests.
 */
class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;

    virtual std::expected<boost::json::value, ToolError> execute(
        const std::string& method,
        const boost::json::object& params,
        std::chrono::milliseconds timeout) = 0;

    // Tool descriptors ({name, description, inputSchema}); empty on failure.
    virtual boost::json::array list_tools() = 0;
};

} // namespace toolrelay::daemon
