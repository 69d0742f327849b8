#include "common/error.hpp"

#include <array>
#include <utility>

namespace toolrelay {

namespace {

constexpr std::array<std::pair<ErrorKind, const char*>, 13> kErrorNames{{
    {ErrorKind::UNAUTHORIZED, "unauthorized"},
    {ErrorKind::OFFLINE, "offline"},
    {ErrorKind::TIMEOUT, "timeout"},
    {ErrorKind::SUPERSEDED, "superseded"},
    {ErrorKind::DISCONNECTED, "disconnected"},
    {ErrorKind::REVOKED, "revoked"},
    {ErrorKind::CANCELLED, "cancelled"},
    {ErrorKind::TOOL_EXECUTION_FAILED, "tool_execution_failed"},
    {ErrorKind::UNKNOWN_METHOD, "unknown_method"},
    {ErrorKind::INVALID_PARAMS, "invalid_params"},
    {ErrorKind::RESPONSE_TOO_LARGE, "response_too_large"},
    {ErrorKind::PROTOCOL_ERROR, "protocol_error"},
    {ErrorKind::CONNECTION_FAILED, "connection_failed"},
}};

} // anonymous namespace

const char* error_kind_name(ErrorKind kind) {
    for (const auto& [k, name] : kErrorNames) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::optional<ErrorKind> error_kind_from_name(std::string_view name) {
    for (const auto& [k, n] : kErrorNames) {
        if (name == n) return k;
    }
    return std::nullopt;
}

bool is_tool_error(ErrorKind kind) {
    return kind == ErrorKind::TOOL_EXECUTION_FAILED ||
           kind == ErrorKind::RESPONSE_TOO_LARGE;
}

bool is_session_loss(ErrorKind kind) {
    return kind == ErrorKind::SUPERSEDED ||
           kind == ErrorKind::DISCONNECTED ||
           kind == ErrorKind::REVOKED;
}

} // namespace toolrelay
