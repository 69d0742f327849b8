#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"
#include "edge/request_facade.hpp"
#include "edge/server.hpp"
#include "edge/session_coordinator.hpp"
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

using namespace toolrelay;
using namespace toolrelay::edge;

namespace {

auto& log() { return Logger::get("edge.main"); }

void print_usage(const char* prog) {
    std::cout << "toolrelay edge\n\n"
              << "Usage:\n"
              << "  " << prog << " -c <config.json>           Start the relay\n"
              << "  " << prog << " -c <config.json> --check   Validate the configuration\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file (default: toolrelay-edge.json)\n"
              << "      --check           Validate config and exit\n"
              << "  -q, --quiet           Suppress log output\n"
              << "  -h, --help            Show help\n\n"
              << "Signals:\n"
              << "  SIGHUP                Reload projects and credentials\n"
              << "  SIGINT, SIGTERM       Shut down\n"
              << std::endl;
}

net::awaitable<void> handle_signals(net::io_context& ioc, const std::string& config_file,
                                    Server& server, std::shared_ptr<SessionCoordinator> coordinator) {
    net::signal_set signals(ioc, SIGINT, SIGTERM);
#ifdef SIGHUP
    signals.add(SIGHUP);
#endif

    while (true) {
        int signal_number = co_await signals.async_wait(net::use_awaitable);

#ifdef SIGHUP
        if (signal_number == SIGHUP) {
            auto reloaded = EdgeConfig::load(config_file);
            if (!reloaded) {
                log().error("Reload failed, keeping current projects: {}",
                            config_error_message(reloaded.error()));
                continue;
            }
            coordinator->sync_projects(reloaded->projects);
            LogManager::instance().set_global_level(reloaded->log.global_level);
            for (const auto& [module, level] : reloaded->log.module_levels) {
                LogManager::instance().set_module_level(module, level);
            }
            log().info("Configuration reloaded ({} projects)", reloaded->projects.size());
            continue;
        }
#endif

        log().info("Received signal {}, shutting down...", signal_number);
        server.stop();
        coordinator->shutdown();

        // Let relay sessions send their close frames
        net::steady_timer grace(ioc, std::chrono::seconds(1));
        co_await grace.async_wait(net::use_awaitable);
        ioc.stop();
        co_return;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file = "toolrelay-edge.json";
    bool check_only = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file name\n";
                return 1;
            }
            config_file = argv[++i];
        } else if (arg == "--check") {
            check_only = true;
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: Unknown argument '" << arg << "'\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config_result = EdgeConfig::load(config_file);
    if (!config_result) {
        std::cerr << "Error: Failed to load configuration from '" << config_file << "': "
                  << config_error_message(config_result.error()) << "\n";
        return 1;
    }
    auto config = std::move(*config_result);

    if (check_only) {
        std::cout << "Configuration OK: " << config.projects.size() << " project(s), port "
                  << config.port << (config.tls ? " (TLS)" : "") << "\n";
        return 0;
    }

    auto log_config = apply_log_env(config.log);
    if (quiet) {
        log_config.global_level = LogLevel::OFF;
    }
    LogManager::instance().init(log_config);

    if (!crypto::init()) {
        log().fatal("Failed to initialize libsodium");
        return 1;
    }

    size_t num_threads = config.num_threads;
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }

    net::io_context ioc(static_cast<int>(num_threads));

    auto coordinator = std::make_shared<SessionCoordinator>(config.timings);
    for (const auto& project : config.projects) {
        coordinator->set_project(project);
    }

    FacadeOptions facade_options;
    facade_options.default_project = config.default_project;
    facade_options.server_name = config.server_name;
    facade_options.request_timeout = config.timings.request_timeout;
    auto facade = std::make_shared<RequestFacade>(coordinator, facade_options);

    std::unique_ptr<Server> server;
    try {
        server = std::make_unique<Server>(ioc, config, coordinator, facade);
        server->listen();
    } catch (const std::exception& e) {
        log().fatal("Failed to start server: {}", e.what());
        return 1;
    }

    auto on_error = [](const char* what) {
        return [what](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    log().error("{} failed: {}", what, e.what());
                }
            }
        };
    };

    net::co_spawn(ioc, server->run(), on_error("Accept loop"));
    net::co_spawn(net::make_strand(ioc), coordinator->run_sweeper(config.sweep_interval),
                  on_error("Sweeper"));
    net::co_spawn(ioc, handle_signals(ioc, config_file, *server, coordinator),
                  on_error("Signal handler"));

    log().info("toolrelay edge starting: {} project(s), default '{}', {} threads",
               config.projects.size(), config.default_project, num_threads);

    std::vector<std::thread> threads;
    threads.reserve(num_threads - 1);
    for (size_t i = 1; i < num_threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();
    for (auto& t : threads) {
        t.join();
    }

    log().info("Shutdown complete");
    LogManager::instance().shutdown();
    return 0;
}
