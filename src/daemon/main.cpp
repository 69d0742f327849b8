#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/http_client.hpp"
#include "common/logger.hpp"
#include "common/url.hpp"
#include "daemon/connection_manager.hpp"
#include "daemon/dispatcher.hpp"
#include "daemon/http_tool_executor.hpp"
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace toolrelay;
using namespace toolrelay::daemon;

namespace {

auto& log() { return Logger::get("daemon.main"); }

struct CliOptions {
    std::string config_file = "toolrelay.json";
    bool json_output = false;
    bool quiet = false;
    std::string command;
};

void print_usage(const char* prog) {
    std::cout << "toolrelay daemon\n\n"
              << "Usage:\n"
              << "  " << prog << " [options] <command>\n\n"
              << "Commands:\n"
              << "  run, connect          Connect to the relay and serve tool calls\n"
              << "  status                Query the relay's health endpoint\n"
              << "  url                   Print the agent-facing endpoints\n"
              << "  check                 Validate the configuration\n"
              << "  token                 Print a new random credential\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file (default: toolrelay.json)\n"
              << "      --json            Machine-readable output\n"
              << "  -q, --quiet           Suppress log output\n"
              << "  -h, --help            Show help\n"
              << std::endl;
}

// http(s) form of the configured base URL
std::string http_base_url(const std::string& base_url) {
    auto parts = parse_url(base_url);
    if (!parts || (parts->scheme != "ws" && parts->scheme != "wss")) {
        return base_url;
    }
    std::string scheme = parts->use_ssl ? "https" : "http";
    std::string rest = base_url.substr(parts->scheme.size());
    // A ws URL normally ends in the /ws endpoint itself
    if (rest.size() >= 3 && rest.compare(rest.size() - 3, 3, "/ws") == 0) {
        rest.resize(rest.size() - 3);
    }
    return scheme + rest;
}

std::expected<DaemonConfig, std::string> load_config(const CliOptions& cli) {
    auto config = DaemonConfig::load(cli.config_file);
    if (!config) {
        return std::unexpected("failed to load configuration from '" + cli.config_file + "': " +
                               config_error_message(config.error()));
    }
    return std::move(*config);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_run(const DaemonConfig& config) {
    if (!crypto::init()) {
        log().fatal("Failed to initialize libsodium");
        return 1;
    }

    net::io_context ioc;

    HttpToolExecutorConfig tools_config;
    tools_config.host = config.tools_host;
    tools_config.port = config.tools_port;
    tools_config.auth_token = config.tools_auth_token;
    auto executor = std::make_shared<HttpToolExecutor>(tools_config);

    DispatcherOptions dispatcher_options;
    dispatcher_options.threads = config.dispatcher_threads;
    dispatcher_options.max_response_bytes = config.max_response_bytes;
    dispatcher_options.default_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(config.tool_timeout) +
        std::chrono::seconds(5);
    auto dispatcher = std::make_shared<LocalDispatcher>(executor, dispatcher_options);

    auto manager = std::make_shared<ConnectionManager>(
        ioc, ConnectionOptions::from_config(config), dispatcher);

    manager->add_state_observer([](ConnectionState old_state, ConnectionState new_state) {
        log().info("Connection: {} -> {}", connection_state_name(old_state),
                   connection_state_name(new_state));
    });

    std::atomic<int> exit_code{0};
    manager->set_give_up_handler([&exit_code](const std::string& reason) {
        std::cerr << "Error: giving up on the relay: " << reason << "\n";
        exit_code = 1;
    });

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](boost::system::error_code ec, int signal_number) {
        if (!ec) {
            log().info("Received signal {}, disconnecting...", signal_number);
            manager->stop();
        }
    });

    // The signal wait keeps the loop alive; release it once the manager is done
    manager->add_state_observer([&signals](ConnectionState, ConnectionState new_state) {
        if (new_state == ConnectionState::DISCONNECTED) {
            boost::system::error_code ignored;
            signals.cancel(ignored);
        }
    });

    log().info("Tool service: {}", executor->base_url());
    log().info("Relay: {}", manager->url());
    manager->start();

    ioc.run();

    dispatcher->shutdown();
    log().info("Daemon stopped");
    return exit_code.load();
}

int cmd_status(const DaemonConfig& config, bool json_output) {
    HttpClientOptions options;
    options.timeout = std::chrono::milliseconds(10000);
    options.ssl_verify = config.ssl_verify;
    options.ssl_ca_file = config.ssl_ca_file;

    auto url = append_path(http_base_url(config.base_url), "/health");
    auto result = http_request(boost::beast::http::verb::get, url, {}, {}, options);
    if (!result) {
        if (json_output) {
            boost::json::object out{{"reachable", false}, {"url", url}, {"error", result.error()}};
            std::cout << boost::json::serialize(out) << "\n";
        } else {
            std::cerr << "Relay unreachable at " << url << ": " << result.error() << "\n";
        }
        return 1;
    }

    boost::system::error_code ec;
    auto body = boost::json::parse(result->body, ec);
    bool online = false;
    if (!ec && body.is_object()) {
        if (auto* v = body.as_object().if_contains("online"); v && v->is_bool()) {
            online = v->as_bool();
        }
    }

    if (json_output) {
        boost::json::object out{
            {"reachable", true},
            {"url", url},
            {"http_status", result->status},
            {"online", online},
        };
        std::cout << boost::json::serialize(out) << "\n";
    } else {
        std::cout << "Relay:    " << http_base_url(config.base_url) << "\n"
                  << "HTTP:     " << result->status << "\n"
                  << "Instance: " << (online ? "connected" : "not connected") << "\n";
    }
    return result->status == 200 ? 0 : 1;
}

int cmd_url(const DaemonConfig& config, bool json_output) {
    auto base = http_base_url(config.base_url);
    auto ws = websocket_url(config.base_url).value_or("");

    if (json_output) {
        boost::json::object out{
            {"base_url", base},
            {"relay", append_path(base, "/relay")},
            {"mcp", append_path(base, "/mcp")},
            {"health", append_path(base, "/health")},
            {"websocket", ws},
        };
        std::cout << boost::json::serialize(out) << "\n";
    } else {
        std::cout << "Base:      " << base << "\n"
                  << "Relay:     " << append_path(base, "/relay") << "\n"
                  << "MCP:       " << append_path(base, "/mcp") << "\n"
                  << "Health:    " << append_path(base, "/health") << "\n"
                  << "WebSocket: " << ws << "\n";
    }
    return 0;
}

int cmd_check(const DaemonConfig& config, const std::string& config_file) {
    std::cout << "Configuration OK: " << config_file << "\n"
              << "  relay:          " << config.base_url << "\n"
              << "  tool service:   " << config.tools_host << ":" << config.tools_port << "\n"
              << "  heartbeat:      " << config.timings.heartbeat_interval.count() << "ms x "
              << config.timings.miss_threshold << "\n"
              << "  request timeout " << config.timings.request_timeout.count() << "ms\n";
    return 0;
}

int cmd_token(bool json_output) {
    if (!crypto::init()) {
        std::cerr << "Error: failed to initialize libsodium\n";
        return 1;
    }
    auto token = crypto::generate_token();
    if (json_output) {
        std::cout << boost::json::serialize(boost::json::object{{"token", token}}) << "\n";
    } else {
        std::cout << token << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions cli;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file name\n";
                return 1;
            }
            cli.config_file = argv[++i];
        } else if (arg == "--json") {
            cli.json_output = true;
        } else if (arg == "-q" || arg == "--quiet") {
            cli.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && cli.command.empty()) {
            cli.command = arg;
        } else {
            std::cerr << "Error: Unknown argument '" << arg << "'\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (cli.command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (cli.command == "token") {
        return cmd_token(cli.json_output);
    }

    if (cli.command != "run" && cli.command != "connect" && cli.command != "status" &&
        cli.command != "url" && cli.command != "check") {
        std::cerr << "Error: Unknown command '" << cli.command << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    auto config = load_config(cli);
    if (!config) {
        std::cerr << "Error: " << config.error() << "\n";
        return 1;
    }

    auto log_config = apply_log_env(config->log);
    if (cli.quiet || (cli.command != "run" && cli.command != "connect")) {
        log_config.global_level = cli.quiet ? LogLevel::OFF : LogLevel::WARN;
    }
    LogManager::instance().init(log_config);

    int rc = 0;
    if (cli.command == "run" || cli.command == "connect") {
        rc = cmd_run(*config);
    } else if (cli.command == "status") {
        rc = cmd_status(*config, cli.json_output);
    } else if (cli.command == "url") {
        rc = cmd_url(*config, cli.json_output);
    } else {
        rc = cmd_check(*config, cli.config_file);
    }

    LogManager::instance().shutdown();
    return rc;
}
