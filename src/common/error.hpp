#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toolrelay {

// ============================================================================
// Relay error taxonomy
// ============================================================================

enum class ErrorKind : uint8_t {
    UNAUTHORIZED,           // bad or missing token
    OFFLINE,                // no live session for the project
    TIMEOUT,                // no reply before the deadline
    SUPERSEDED,             // owning session replaced by a newer one
    DISCONNECTED,           // owning session closed or went silent
    REVOKED,                // project credentials rotated or removed
    CANCELLED,              // the HTTP caller went away
    TOOL_EXECUTION_FAILED,  // the tool raised or the local service failed
    UNKNOWN_METHOD,
    INVALID_PARAMS,
    RESPONSE_TOO_LARGE,
    PROTOCOL_ERROR,         // malformed or unexpected frame
    CONNECTION_FAILED,      // transport-level failure
};

// Wire name, e.g. "tool_execution_failed"
const char* error_kind_name(ErrorKind kind);

std::optional<ErrorKind> error_kind_from_name(std::string_view name);

// Errors raised by the tool itself rather than by the relay path.
bool is_tool_error(ErrorKind kind);

// Errors that end a request which was already accepted by a live session.
bool is_session_loss(ErrorKind kind);

struct RelayError {
    ErrorKind kind;
    std::string message;

    static RelayError make(ErrorKind kind, std::string message = {}) {
        return RelayError{kind, std::move(message)};
    }
};

} // namespace toolrelay
