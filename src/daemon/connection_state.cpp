#include "daemon/connection_state.hpp"
#include <ctime>

namespace toolrelay::daemon {

namespace {

std::string iso8601(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // anonymous namespace

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::AUTHENTICATING: return "authenticating";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::RECONNECTING: return "reconnecting";
    }
    return "unknown";
}

bool is_valid_transition(ConnectionState from, ConnectionState to) {
    using S = ConnectionState;
    if (to == S::DISCONNECTED) {
        return from != S::DISCONNECTED;
    }
    switch (from) {
        case S::DISCONNECTED: return to == S::CONNECTING;
        case S::CONNECTING: return to == S::AUTHENTICATING || to == S::RECONNECTING;
        case S::AUTHENTICATING: return to == S::CONNECTED || to == S::RECONNECTING;
        case S::CONNECTED: return to == S::RECONNECTING;
        case S::RECONNECTING: return to == S::CONNECTING;
    }
    return false;
}

boost::json::object ConnectionStatus::to_json() const {
    boost::json::object obj;
    obj["state"] = connection_state_name(state);
    obj["connected"] = state == ConnectionState::CONNECTED;
    obj["url"] = url;
    obj["connected_at"] = connected_at ? boost::json::value(iso8601(*connected_at)) : nullptr;
    obj["last_heartbeat"] = last_heartbeat_at ? boost::json::value(iso8601(*last_heartbeat_at)) : nullptr;
    obj["error"] = last_error.empty() ? boost::json::value(nullptr) : boost::json::value(last_error);
    obj["reconnect_attempts"] = reconnect_attempts;
    obj["auth_failures"] = auth_failures;
    obj["next_retry_ms"] = next_retry_delay.count();
    obj["frames_sent"] = frames_sent;
    obj["frames_received"] = frames_received;
    return obj;
}

} // namespace toolrelay::daemon
