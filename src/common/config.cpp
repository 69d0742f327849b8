#include "common/config.hpp"
#include "common/url.hpp"
#include <boost/json.hpp>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

uint64_t juint(const json::object& obj, std::string_view key, uint64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_uint64()) return it->value().as_uint64();
        if (it->value().is_int64() && it->value().as_int64() >= 0)
            return static_cast<uint64_t>(it->value().as_int64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

const json::array* jarray(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_array())
        return &it->value().as_array();
    return nullptr;
}

}  // anonymous namespace

namespace toolrelay {

namespace {

auto& log() { return Logger::get("common.config"); }

std::expected<std::string, ConfigError> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void parse_timings(const json::object& section, RelayTimings& timings) {
    if (auto v = juint(section, "heartbeat_interval_ms"))
        timings.heartbeat_interval = std::chrono::milliseconds(v);
    if (auto v = juint(section, "heartbeat_miss_threshold"))
        timings.miss_threshold = static_cast<uint32_t>(v);
    if (auto v = juint(section, "request_timeout_ms"))
        timings.request_timeout = std::chrono::milliseconds(v);
}

void parse_log(const json::object& section, LogConfig& log_config) {
    log_config.global_level = log_level_from_string(jstr(section, "level", "info"));
    log_config.file_path = jstr(section, "file", log_config.file_path);
    log_config.console_enabled = jbool(section, "console", log_config.console_enabled);
    if (auto v = juint(section, "max_size_mb"))
        log_config.file_max_size = static_cast<size_t>(v) * 1024 * 1024;
    if (auto v = juint(section, "max_files"))
        log_config.file_max_files = static_cast<size_t>(v);

    if (auto* modules = jsection(section, "modules")) {
        for (const auto& [name, level] : *modules) {
            if (level.is_string()) {
                log_config.module_levels[std::string(name)] =
                    log_level_from_string(std::string(level.as_string()));
            }
        }
    }
}

bool check_timings(const RelayTimings& timings) {
    if (timings.is_valid()) {
        return true;
    }
    log().error("request_timeout_ms ({}) must exceed heartbeat_interval_ms ({}) x miss threshold ({})",
                timings.request_timeout.count(), timings.heartbeat_interval.count(),
                timings.miss_threshold);
    return false;
}

} // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

// ============================================================================
// EdgeConfig
// ============================================================================

const ProjectConfig* EdgeConfig::find_project(const std::string& id) const {
    for (const auto& project : projects) {
        if (project.id == id) return &project;
    }
    return nullptr;
}

std::expected<EdgeConfig, ConfigError> EdgeConfig::load(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return parse(*content);
}

std::expected<EdgeConfig, ConfigError> EdgeConfig::parse(const std::string& json_content) {
    EdgeConfig config;

    try {
        auto jv = json::parse(json_content);
        auto& root = jv.as_object();

        // server section
        if (auto* server = jsection(root, "server")) {
            config.bind_address = jstr(*server, "bind", config.bind_address);
            auto port = juint(*server, "port", config.port);
            if (port > 65535) {
                log().error("server.port out of range: {}", port);
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.port = static_cast<uint16_t>(port);
            config.num_threads = static_cast<size_t>(juint(*server, "threads", config.num_threads));
            config.tls = jbool(*server, "tls", config.tls);
            config.server_name = jstr(*server, "name", config.server_name);
        }

        // ssl section
        if (auto* ssl = jsection(root, "ssl")) {
            config.cert_file = jstr(*ssl, "cert");
            config.key_file = jstr(*ssl, "key");
            config.self_signed = jbool(*ssl, "self_signed", config.self_signed);
        }

        // relay section
        if (auto* relay = jsection(root, "relay")) {
            parse_timings(*relay, config.timings);
            if (auto v = juint(*relay, "sweep_interval_ms"))
                config.sweep_interval = std::chrono::milliseconds(v);
            config.default_project = jstr(*relay, "default_project", config.default_project);
        }

        // projects array
        if (auto* projects = jarray(root, "projects")) {
            for (const auto& entry : *projects) {
                if (!entry.is_object()) {
                    return std::unexpected(ConfigError::INVALID_VALUE);
                }
                const auto& p = entry.as_object();
                ProjectConfig project;
                project.id = jstr(p, "id");
                project.credentials.relay_token = jstr(p, "relay_token");
                project.credentials.agent_token = jstr(p, "agent_token");
                config.projects.push_back(std::move(project));
            }
        }

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            parse_log(*log_sec, config.log);
        }

    } catch (const std::exception& e) {
        log().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    // Validation
    if (config.tls && !config.self_signed && (config.cert_file.empty() || config.key_file.empty())) {
        log().error("TLS enabled but ssl.cert / ssl.key not set");
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    if (config.projects.empty()) {
        log().error("No projects configured");
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }

    std::unordered_set<std::string> seen;
    for (const auto& project : config.projects) {
        if (project.id.empty() || project.id.find('/') != std::string::npos) {
            log().error("Invalid project id '{}'", project.id);
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        if (!seen.insert(project.id).second) {
            log().error("Duplicate project id '{}'", project.id);
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        if (project.credentials.relay_token.empty() || project.credentials.agent_token.empty()) {
            log().error("Project '{}' is missing relay_token or agent_token", project.id);
            return std::unexpected(ConfigError::MISSING_REQUIRED);
        }
    }

    if (!config.default_project.empty() && !config.find_project(config.default_project)) {
        // Unprefixed paths are only served when the default project exists
        log().warn("Default project '{}' is not configured; unprefixed routes disabled",
                   config.default_project);
        config.default_project.clear();
    }

    if (!check_timings(config.timings) || config.sweep_interval.count() <= 0) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    return config;
}

// ============================================================================
// DaemonConfig
// ============================================================================

std::expected<DaemonConfig, ConfigError> DaemonConfig::load(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return parse(*content);
}

std::expected<DaemonConfig, ConfigError> DaemonConfig::parse(const std::string& json_content) {
    DaemonConfig config;

    try {
        auto jv = json::parse(json_content);
        auto& root = jv.as_object();

        // relay section
        if (auto* relay = jsection(root, "relay")) {
            config.base_url = jstr(*relay, "base_url");
            config.credentials.relay_token = jstr(*relay, "relay_token");
            config.credentials.agent_token = jstr(*relay, "agent_token");
        }

        // tools section
        if (auto* tools = jsection(root, "tools")) {
            config.tools_host = jstr(*tools, "host", config.tools_host);
            auto port = juint(*tools, "port", config.tools_port);
            if (port == 0 || port > 65535) {
                log().error("tools.port out of range: {}", port);
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.tools_port = static_cast<uint16_t>(port);
            config.tools_auth_token = jstr(*tools, "auth_token");
            if (auto v = juint(*tools, "timeout_seconds"))
                config.tool_timeout = std::chrono::seconds(v);
            if (auto v = juint(*tools, "max_response_bytes"))
                config.max_response_bytes = static_cast<size_t>(v);
            if (auto v = juint(*tools, "threads"))
                config.dispatcher_threads = static_cast<size_t>(v);
        }

        // connection section
        if (auto* conn = jsection(root, "connection")) {
            parse_timings(*conn, config.timings);
            if (auto v = juint(*conn, "reconnect_initial_ms"))
                config.backoff.initial_delay = std::chrono::milliseconds(v);
            if (auto v = juint(*conn, "reconnect_max_ms"))
                config.backoff.max_delay = std::chrono::milliseconds(v);
            config.max_auth_failures = static_cast<uint32_t>(
                juint(*conn, "max_auth_failures", config.max_auth_failures));
        }

        // ssl section
        if (auto* ssl = jsection(root, "ssl")) {
            config.ssl_verify = jbool(*ssl, "verify", true);
            config.ssl_ca_file = jstr(*ssl, "ca_file");
        }

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            parse_log(*log_sec, config.log);
        }

    } catch (const std::exception& e) {
        log().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    // Validation
    if (config.base_url.empty() || config.credentials.relay_token.empty()) {
        log().error("relay.base_url and relay.relay_token are required");
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    if (!websocket_url(config.base_url)) {
        log().error("Invalid relay.base_url: {}", config.base_url);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (config.backoff.initial_delay.count() <= 0 ||
        config.backoff.max_delay < config.backoff.initial_delay) {
        log().error("Invalid reconnect backoff bounds");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (config.max_response_bytes == 0 || config.dispatcher_threads == 0) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (!check_timings(config.timings)) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    return config;
}

} // namespace toolrelay
