#include <gtest/gtest.h>
#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/retry.hpp"
#include "common/url.hpp"
#include <cstdlib>

using namespace toolrelay;
using namespace std::chrono_literals;

// ============================================================================
// RetryState
// ============================================================================

TEST(RetryTest, ExponentialBackoffCapsAtMax) {
    RetryState retry;
    std::vector<int64_t> delays;
    for (int i = 0; i < 9; ++i) {
        delays.push_back(retry.next_delay().count());
    }
    std::vector<int64_t> expected{1000, 2000, 4000, 8000, 16000, 32000, 60000, 60000, 60000};
    EXPECT_EQ(delays, expected);
    EXPECT_EQ(retry.attempt(), 9u);
}

TEST(RetryTest, ResetAfterSuccess) {
    RetryState retry;
    retry.next_delay();
    retry.next_delay();
    EXPECT_EQ(retry.next_delay(), 4000ms);

    retry.reset();
    EXPECT_EQ(retry.attempt(), 0u);
    EXPECT_EQ(retry.next_delay(), 1000ms);
}

TEST(RetryTest, CustomPolicy) {
    RetryState retry(RetryPolicy{10ms, 50ms, 3.0});
    EXPECT_EQ(retry.next_delay(), 10ms);
    EXPECT_EQ(retry.next_delay(), 30ms);
    EXPECT_EQ(retry.next_delay(), 50ms);
    EXPECT_EQ(retry.next_delay(), 50ms);
}

// ============================================================================
// URLs
// ============================================================================

TEST(UrlTest, ParseHttps) {
    auto parts = parse_url("https://relay.example.com/projects/alpha");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->scheme, "https");
    EXPECT_EQ(parts->host, "relay.example.com");
    EXPECT_EQ(parts->port, "443");
    EXPECT_EQ(parts->path, "/projects/alpha");
    EXPECT_TRUE(parts->use_ssl);
    EXPECT_EQ(parts->host_header(), "relay.example.com");
}

TEST(UrlTest, ParseExplicitPort) {
    auto parts = parse_url("ws://127.0.0.1:8787");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->port, "8787");
    EXPECT_EQ(parts->path, "/");
    EXPECT_FALSE(parts->use_ssl);
    EXPECT_EQ(parts->host_header(), "127.0.0.1:8787");
}

TEST(UrlTest, RejectsInvalid) {
    EXPECT_FALSE(parse_url("ftp://example.com").has_value());
    EXPECT_FALSE(parse_url("example.com").has_value());
    EXPECT_FALSE(parse_url("http://example.com:0").has_value());
    EXPECT_FALSE(parse_url("http://example.com:70000").has_value());
}

TEST(UrlTest, WebSocketUrl) {
    EXPECT_EQ(websocket_url("https://relay.example.com"), "wss://relay.example.com/ws");
    EXPECT_EQ(websocket_url("http://localhost:8787/"), "ws://localhost:8787/ws");
    EXPECT_EQ(websocket_url("https://relay.example.com/projects/alpha"),
              "wss://relay.example.com/projects/alpha/ws");
    EXPECT_EQ(websocket_url("wss://relay.example.com/custom"), "wss://relay.example.com/custom");
    EXPECT_FALSE(websocket_url("not a url").has_value());
}

TEST(UrlTest, AppendPath) {
    EXPECT_EQ(append_path("http://h/", "/relay"), "http://h/relay");
    EXPECT_EQ(append_path("http://h", "relay"), "http://h/relay");
}

// ============================================================================
// RelayTimings
// ============================================================================

TEST(TimingsTest, DefaultsSatisfyLivenessOrdering) {
    RelayTimings timings;
    EXPECT_EQ(timings.liveness_window(), 24000ms);
    EXPECT_TRUE(timings.is_valid());
}

TEST(TimingsTest, RequestTimeoutMustExceedLivenessWindow) {
    RelayTimings timings;
    timings.request_timeout = 24000ms;
    EXPECT_FALSE(timings.is_valid());
    timings.request_timeout = 24001ms;
    EXPECT_TRUE(timings.is_valid());
    timings.miss_threshold = 0;
    EXPECT_FALSE(timings.is_valid());
}

// ============================================================================
// EdgeConfig
// ============================================================================

TEST(EdgeConfigTest, ParseFull) {
    auto config = EdgeConfig::parse(R"({
        "server": {"bind": "127.0.0.1", "port": 9000, "threads": 2, "name": "relay-test"},
        "relay": {"heartbeat_interval_ms": 1000, "heartbeat_miss_threshold": 2,
                  "request_timeout_ms": 5000, "sweep_interval_ms": 250,
                  "default_project": "alpha"},
        "projects": [
            {"id": "alpha", "relay_token": "r-alpha", "agent_token": "a-alpha"},
            {"id": "beta", "relay_token": "r-beta", "agent_token": "a-beta"}
        ],
        "log": {"level": "debug", "modules": {"edge.session": "trace"}}
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->bind_address, "127.0.0.1");
    EXPECT_EQ(config->port, 9000);
    EXPECT_EQ(config->num_threads, 2u);
    EXPECT_EQ(config->server_name, "relay-test");
    EXPECT_EQ(config->timings.heartbeat_interval, 1000ms);
    EXPECT_EQ(config->timings.miss_threshold, 2u);
    EXPECT_EQ(config->timings.request_timeout, 5000ms);
    EXPECT_EQ(config->sweep_interval, 250ms);
    EXPECT_EQ(config->default_project, "alpha");
    ASSERT_EQ(config->projects.size(), 2u);
    ASSERT_NE(config->find_project("beta"), nullptr);
    EXPECT_EQ(config->find_project("beta")->credentials.agent_token, "a-beta");
    EXPECT_EQ(config->find_project("gamma"), nullptr);
    EXPECT_EQ(config->log.global_level, LogLevel::DEBUG);
    EXPECT_EQ(config->log.module_levels.at("edge.session"), LogLevel::TRACE);
}

TEST(EdgeConfigTest, RejectsTimeoutInsideLivenessWindow) {
    auto config = EdgeConfig::parse(R"({
        "relay": {"heartbeat_interval_ms": 8000, "heartbeat_miss_threshold": 3,
                  "request_timeout_ms": 20000},
        "projects": [{"id": "default", "relay_token": "r", "agent_token": "a"}]
    })");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::INVALID_VALUE);
}

TEST(EdgeConfigTest, RejectsBadProjects) {
    EXPECT_EQ(EdgeConfig::parse(R"({"projects": []})").error(), ConfigError::MISSING_REQUIRED);
    EXPECT_EQ(EdgeConfig::parse(R"({"projects": [{"id": "a", "relay_token": "r"}]})").error(),
              ConfigError::MISSING_REQUIRED);
    EXPECT_EQ(EdgeConfig::parse(R"({"projects": [
                  {"id": "a", "relay_token": "r", "agent_token": "x"},
                  {"id": "a", "relay_token": "s", "agent_token": "y"}]})").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(EdgeConfig::parse(R"({"projects": [
                  {"id": "a/b", "relay_token": "r", "agent_token": "x"}]})").error(),
              ConfigError::INVALID_VALUE);
}

TEST(EdgeConfigTest, MissingDefaultProjectDisablesUnprefixedRoutes) {
    auto config = EdgeConfig::parse(R"({
        "projects": [{"id": "alpha", "relay_token": "r", "agent_token": "a"}]
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->default_project.empty());
}

TEST(EdgeConfigTest, TlsRequiresCertificate) {
    auto config = EdgeConfig::parse(R"({
        "server": {"tls": true},
        "projects": [{"id": "default", "relay_token": "r", "agent_token": "a"}]
    })");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::MISSING_REQUIRED);

    auto self_signed = EdgeConfig::parse(R"({
        "server": {"tls": true},
        "ssl": {"self_signed": true},
        "projects": [{"id": "default", "relay_token": "r", "agent_token": "a"}]
    })");
    ASSERT_TRUE(self_signed.has_value());
    EXPECT_TRUE(self_signed->tls);
    EXPECT_TRUE(self_signed->self_signed);
}

TEST(EdgeConfigTest, ParseErrors) {
    EXPECT_EQ(EdgeConfig::parse("{broken").error(), ConfigError::PARSE_ERROR);
    EXPECT_EQ(EdgeConfig::load("/nonexistent/toolrelay-edge.json").error(),
              ConfigError::FILE_NOT_FOUND);
}

// ============================================================================
// DaemonConfig
// ============================================================================

TEST(DaemonConfigTest, ParseWithDefaults) {
    auto config = DaemonConfig::parse(R"({
        "relay": {"base_url": "https://relay.example.com", "relay_token": "r", "agent_token": "a"}
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->tools_host, "127.0.0.1");
    EXPECT_EQ(config->tools_port, 37800);
    EXPECT_EQ(config->tool_timeout, 30s);
    EXPECT_EQ(config->timings.heartbeat_interval, 8000ms);
    EXPECT_EQ(config->backoff.initial_delay, 1000ms);
    EXPECT_EQ(config->backoff.max_delay, 60000ms);
    EXPECT_EQ(config->max_auth_failures, 0u);
    EXPECT_TRUE(config->ssl_verify);
}

TEST(DaemonConfigTest, ParseOverrides) {
    auto config = DaemonConfig::parse(R"({
        "relay": {"base_url": "ws://localhost:8787/ws", "relay_token": "r"},
        "tools": {"host": "localhost", "port": 4000, "auth_token": "t",
                  "timeout_seconds": 10, "max_response_bytes": 2048, "threads": 8},
        "connection": {"heartbeat_interval_ms": 500, "heartbeat_miss_threshold": 4,
                       "request_timeout_ms": 3000, "reconnect_initial_ms": 100,
                       "reconnect_max_ms": 2000, "max_auth_failures": 3},
        "ssl": {"verify": false}
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->tools_port, 4000);
    EXPECT_EQ(config->tools_auth_token, "t");
    EXPECT_EQ(config->tool_timeout, 10s);
    EXPECT_EQ(config->max_response_bytes, 2048u);
    EXPECT_EQ(config->dispatcher_threads, 8u);
    EXPECT_EQ(config->timings.miss_threshold, 4u);
    EXPECT_EQ(config->backoff.initial_delay, 100ms);
    EXPECT_EQ(config->backoff.max_delay, 2000ms);
    EXPECT_EQ(config->max_auth_failures, 3u);
    EXPECT_FALSE(config->ssl_verify);
}

TEST(DaemonConfigTest, RejectsInvalid) {
    EXPECT_EQ(DaemonConfig::parse(R"({"relay": {"relay_token": "r"}})").error(),
              ConfigError::MISSING_REQUIRED);
    EXPECT_EQ(DaemonConfig::parse(R"({"relay": {"base_url": "ftp://x", "relay_token": "r"}})").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(DaemonConfig::parse(R"({
                  "relay": {"base_url": "http://x", "relay_token": "r"},
                  "connection": {"reconnect_initial_ms": 5000, "reconnect_max_ms": 1000}})").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(DaemonConfig::parse(R"({
                  "relay": {"base_url": "http://x", "relay_token": "r"},
                  "tools": {"port": 0}})").error(),
              ConfigError::INVALID_VALUE);
}

// ============================================================================
// Log settings
// ============================================================================

TEST(LogConfigTest, LevelNames) {
    EXPECT_EQ(log_level_from_string("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(log_level_from_string("warning"), LogLevel::WARN);
    EXPECT_EQ(log_level_from_string("critical"), LogLevel::FATAL);
    EXPECT_EQ(log_level_from_string("nonsense"), LogLevel::INFO);
}

TEST(LogConfigTest, EnvironmentOverrides) {
    ::setenv("TOOLRELAY_LOG_LEVEL", "trace", 1);
    ::setenv("TOOLRELAY_LOG_FILE", "/tmp/toolrelay-test.log", 1);

    LogConfig base;
    base.global_level = LogLevel::WARN;
    auto config = apply_log_env(base);

    ::unsetenv("TOOLRELAY_LOG_LEVEL");
    ::unsetenv("TOOLRELAY_LOG_FILE");

    EXPECT_EQ(config.global_level, LogLevel::TRACE);
    EXPECT_EQ(config.file_path, "/tmp/toolrelay-test.log");

    auto untouched = apply_log_env(base);
    EXPECT_EQ(untouched.global_level, LogLevel::WARN);
    EXPECT_TRUE(untouched.file_path.empty());
}
