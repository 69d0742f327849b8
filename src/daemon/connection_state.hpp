#pragma once

#include <boost/json/object.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace toolrelay::daemon {

// Disconnected -> Connecting -> Authenticating -> Connected -> Reconnecting -> ...
enum class ConnectionState : uint8_t {
    DISCONNECTED,
    CONNECTING,
    AUTHENTICATING,
    CONNECTED,
    RECONNECTING,
};

const char* connection_state_name(ConnectionState state);

// Whether the state machine permits moving from `from` to `to`.
bool is_valid_transition(ConnectionState from, ConnectionState to);

struct ConnectionStatus {
    ConnectionState state{ConnectionState::DISCONNECTED};
    std::string url;
    std::optional<std::chrono::system_clock::time_point> connected_at;
    std::optional<std::chrono::system_clock::time_point> last_heartbeat_at;
    std::string last_error;
    uint32_t reconnect_attempts = 0;
    uint32_t auth_failures = 0;
    std::chrono::milliseconds next_retry_delay{0};
    uint64_t frames_sent = 0;
    uint64_t frames_received = 0;

    boost::json::object to_json() const;
};

} // namespace toolrelay::daemon
