#include "common/logger.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace toolrelay {

// ============================================================================
// Log Level Utilities
// ============================================================================

LogLevel log_level_from_string(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace" || lower == "verbose") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "err") return LogLevel::ERROR;
    if (lower == "fatal" || lower == "critical") return LogLevel::FATAL;
    if (lower == "off") return LogLevel::OFF;

    return LogLevel::INFO;  // Default
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::FATAL: return spdlog::level::critical;
        case LogLevel::OFF:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogConfig apply_log_env(LogConfig config) {
    if (const char* level = std::getenv("TOOLRELAY_LOG_LEVEL")) {
        config.global_level = log_level_from_string(level);
    }
    if (const char* file = std::getenv("TOOLRELAY_LOG_FILE")) {
        config.file_path = file;
    }
    return config;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string module, std::shared_ptr<spdlog::logger> logger)
    : module_(std::move(module)), logger_(std::move(logger)) {}

Logger& Logger::get(const std::string& module) {
    return LogManager::instance().get_logger(module);
}

// ============================================================================
// LogManager
// ============================================================================

LogManager& LogManager::instance() {
    static LogManager instance;
    return instance;
}

LogManager::~LogManager() {
    flush();
}

void LogManager::init(const LogConfig& config) {
    std::unique_lock lock(mutex_);
    config_ = config;
    rebuild_sinks();

    for (auto& [name, logger] : loggers_) {
        logger->logger_->sinks() = sinks_;
        logger->logger_->set_pattern(config_.pattern);
    }
    apply_levels();
    initialized_ = true;
}

void LogManager::rebuild_sinks() {
    sinks_.clear();

    if (config_.console_enabled) {
        sinks_.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!config_.file_path.empty()) {
        try {
            sinks_.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config_.file_path, config_.file_max_size, config_.file_max_files));
        } catch (const spdlog::spdlog_ex& e) {
            // Keep console logging working when the file cannot be opened
            fprintf(stderr, "Failed to open log file %s: %s\n", config_.file_path.c_str(), e.what());
        }
    }
}

void LogManager::set_global_level(LogLevel level) {
    std::unique_lock lock(mutex_);
    config_.global_level = level;
    apply_levels();
}

void LogManager::set_module_level(const std::string& module, LogLevel level) {
    std::unique_lock lock(mutex_);
    config_.module_levels[module] = level;
    apply_levels();
}

void LogManager::apply_levels() {
    for (auto& [name, logger] : loggers_) {
        logger->logger_->set_level(to_spdlog_level(resolve_level(name)));
    }
}

void LogManager::flush() {
    std::shared_lock lock(mutex_);
    for (auto& [name, logger] : loggers_) {
        logger->logger_->flush();
    }
}

void LogManager::shutdown() {
    flush();
    std::unique_lock lock(mutex_);
    for (auto& [name, logger] : loggers_) {
        logger->logger_->sinks().clear();
    }
    sinks_.clear();
    initialized_ = false;
}

Logger& LogManager::get_logger(const std::string& module) {
    {
        std::shared_lock lock(mutex_);
        auto it = loggers_.find(module);
        if (it != loggers_.end()) {
            return *it->second;
        }
    }

    std::unique_lock lock(mutex_);
    auto it = loggers_.find(module);
    if (it != loggers_.end()) {
        return *it->second;
    }

    if (!initialized_ && sinks_.empty()) {
        // Logging before init(): console with defaults
        rebuild_sinks();
    }

    auto logger = std::unique_ptr<Logger>(new Logger(module, create_logger(module)));
    auto& ref = *logger;
    loggers_.emplace(module, std::move(logger));
    return ref;
}

std::shared_ptr<spdlog::logger> LogManager::create_logger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_pattern(config_.pattern);
    logger->set_level(to_spdlog_level(resolve_level(name)));
    return logger;
}

// Longest matching module prefix wins: "edge" covers "edge.server".
LogLevel LogManager::resolve_level(const std::string& module) const {
    std::string key = module;
    while (true) {
        auto it = config_.module_levels.find(key);
        if (it != config_.module_levels.end()) {
            return it->second;
        }
        auto dot = key.rfind('.');
        if (dot == std::string::npos) {
            break;
        }
        key.resize(dot);
    }
    return config_.global_level;
}

} // namespace toolrelay
