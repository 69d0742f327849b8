#pragma once

// Undefine Windows ERROR macro to avoid conflict with LogLevel::ERROR
#ifdef ERROR
#undef ERROR
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toolrelay {

// Log levels matching spdlog
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6,
};

LogLevel log_level_from_string(std::string_view str);
spdlog::level::level_enum to_spdlog_level(LogLevel level);

// Log configuration
struct LogConfig {
    LogLevel global_level = LogLevel::INFO;

    // Console output
    bool console_enabled = true;

    // File output (rotating)
    std::string file_path;
    size_t file_max_size = 10 * 1024 * 1024;  // 10MB
    size_t file_max_files = 5;

    // Module-specific levels, e.g. {"edge.coordinator": DEBUG}
    std::unordered_map<std::string, LogLevel> module_levels;

    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%t] %v";
};

// Apply TOOLRELAY_LOG_LEVEL / TOOLRELAY_LOG_FILE on top of a config.
LogConfig apply_log_env(LogConfig config);

// Named handle onto the shared sinks. Obtained through Logger::get and kept
// for the life of the process.
class Logger {
public:
    static Logger& get(const std::string& module);

    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        auto lvl = to_spdlog_level(level);
        if (logger_ && logger_->should_log(lvl)) {
            logger_->log(lvl, fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) { log(LogLevel::TRACE, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) { log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) { log(LogLevel::INFO, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) { log(LogLevel::WARN, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) { log(LogLevel::ERROR, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void fatal(spdlog::format_string_t<Args...> fmt, Args&&... args) { log(LogLevel::FATAL, fmt, std::forward<Args>(args)...); }

    const std::string& module() const { return module_; }

private:
    friend class LogManager;
    Logger(std::string module, std::shared_ptr<spdlog::logger> logger);

    std::string module_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Global log manager
class LogManager {
public:
    static LogManager& instance();

    // Initialize with config. Call once at startup before worker threads run;
    // loggers created earlier are re-pointed at the new sinks.
    void init(const LogConfig& config);

    // Runtime level changes, used on config reload
    void set_global_level(LogLevel level);
    void set_module_level(const std::string& module, LogLevel level);

    void flush();
    void shutdown();

    Logger& get_logger(const std::string& module);

private:
    LogManager() = default;
    ~LogManager();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    std::shared_ptr<spdlog::logger> create_logger(const std::string& name);
    LogLevel resolve_level(const std::string& module) const;
    void rebuild_sinks();
    void apply_levels();

    mutable std::shared_mutex mutex_;
    bool initialized_ = false;
    LogConfig config_;

    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
};

// Usage: LOG_INFO("edge.server", "listening on {}", port);

#define LOG_DEBUG(module, ...) ::toolrelay::Logger::get(module).debug(__VA_ARGS__)
#define LOG_INFO(module, ...)  ::toolrelay::Logger::get(module).info(__VA_ARGS__)
#define LOG_WARN(module, ...)  ::toolrelay::Logger::get(module).warn(__VA_ARGS__)

} // namespace toolrelay
