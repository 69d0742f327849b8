#pragma once

#include "common/logger.hpp"
#include "common/retry.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace toolrelay {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Shared settings
// ============================================================================

/**
 * The three time constants governing liveness.
 *
 * A request must be allowed to outlive the window in which a dead session is
 * detected, so request_timeout > heartbeat_interval * miss_threshold.
 */
struct RelayTimings {
    std::chrono::milliseconds heartbeat_interval{8000};
    uint32_t miss_threshold = 3;
    std::chrono::milliseconds request_timeout{30000};

    std::chrono::milliseconds liveness_window() const {
        return heartbeat_interval * miss_threshold;
    }

    bool is_valid() const {
        return heartbeat_interval.count() > 0 && miss_threshold > 0 &&
               request_timeout > liveness_window();
    }
};

struct CredentialPair {
    std::string relay_token;   // authenticates the local daemon
    std::string agent_token;   // authenticates HTTP callers
};

// ============================================================================
// Edge Configuration
// ============================================================================

struct ProjectConfig {
    std::string id;
    CredentialPair credentials;
};

struct EdgeConfig {
    // Server settings
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8787;
    size_t num_threads = 0;  // 0 = auto (hardware_concurrency)
    bool tls = false;

    // SSL settings (only used if tls = true)
    std::string cert_file;
    std::string key_file;
    bool self_signed = false;  // generate a throwaway certificate when none is given

    // Relay settings
    RelayTimings timings;
    std::chrono::milliseconds sweep_interval{1000};
    std::string default_project = "default";  // served on unprefixed paths, empty = none
    std::string server_name = "toolrelay";

    std::vector<ProjectConfig> projects;

    LogConfig log;

    const ProjectConfig* find_project(const std::string& id) const;

    static std::expected<EdgeConfig, ConfigError> load(const std::string& path);
    static std::expected<EdgeConfig, ConfigError> parse(const std::string& json_content);
};

// ============================================================================
// Daemon Configuration
// ============================================================================

struct DaemonConfig {
    // Edge endpoint, e.g. https://relay.example.com or .../projects/<id>
    std::string base_url;
    CredentialPair credentials;

    // Local tool-execution service
    std::string tools_host = "127.0.0.1";
    uint16_t tools_port = 37800;
    std::string tools_auth_token;
    std::chrono::seconds tool_timeout{30};
    size_t max_response_bytes = 1024 * 1024;
    size_t dispatcher_threads = 4;

    // Connection settings
    RelayTimings timings;
    RetryPolicy backoff = RetryPolicy::reconnect();
    uint32_t max_auth_failures = 0;  // 0 = retry forever
    bool ssl_verify = true;
    std::string ssl_ca_file;

    LogConfig log;

    static std::expected<DaemonConfig, ConfigError> load(const std::string& path);
    static std::expected<DaemonConfig, ConfigError> parse(const std::string& json_content);
};

} // namespace toolrelay
