// Tessera Core
// logger.cpp - Logging implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>
#include <tessera/core/config.hpp>
#include <tessera/core/logger.hpp>
#include <tessera/platform/file_io.hpp>
#include <unordered_map>
#include <utility>

namespace tessera::core {

namespace {

struct LoggerState {
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels;
    std::shared_ptr<spdlog::logger> logger;
    std::mutex mutex;
};

LoggerState& get_state() {
    static LoggerState state;
    return state;
}

constexpr std::array<std::pair<LogLevel, const char*>, 7> LEVEL_NAMES = {{
    {LogLevel::Trace, "trace"},
    {LogLevel::Debug, "debug"},
    {LogLevel::Info, "info"},
    {LogLevel::Warn, "warn"},
    {LogLevel::Error, "error"},
    {LogLevel::Critical, "critical"},
    {LogLevel::Off, "off"},
}};

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
    }
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    for (const auto& [level, level_name] : LEVEL_NAMES) {
        if (name == level_name) {
            return level;
        }
    }
    if (name == "warning") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    for (const auto& [candidate, level_name] : LEVEL_NAMES) {
        if (candidate == level) {
            return level_name;
        }
    }
    return "unknown";
}

LoggerConfig LoggerConfig::from_config(const Config& config) {
    LoggerConfig result;

    const std::string level_name =
        config.get_string(config_section::DEBUG, config_key::LOG_LEVEL, log_level_name(result.console_level));
    if (auto level = parse_log_level(level_name)) {
        result.console_level = *level;
    } else {
        // The logger is not up yet when its own config is read
        spdlog::warn("Unknown log_level '{}', using {}", level_name, log_level_name(result.console_level));
    }
    return result;
}

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;

    {
        std::lock_guard lock(state.mutex);

        if (state.initialized) {
            return;
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(config.console_level));
        if (config.include_timestamps) {
            console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        } else {
            console_sink->set_pattern("[%^%l%$] %v");
        }

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        if (config.file_output) {
            try {
                std::filesystem::path log_dir = config.log_directory;
                if (log_dir.empty()) {
                    log_dir = platform::FileSystem::get_user_data_directory() / "logs";
                }
                if (!platform::FileSystem::exists(log_dir) && !platform::FileSystem::create_directories(log_dir)) {
                    spdlog::error("Log directory {} unavailable; logging to console only", log_dir.string());
                } else {
                    log_path = log_dir / config.log_filename;
                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        log_path.string(), config.max_file_size, config.max_files);
                    file_sink->set_level(to_spdlog_level(config.file_level));
                    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                    sinks.push_back(file_sink);
                }
            } catch (const spdlog::spdlog_ex& ex) {
                // Console-only logging if the file sink cannot be opened
                spdlog::error("Log file sink unavailable: {}", ex.what());
                log_path.clear();
            }
        }

        state.logger = std::make_shared<spdlog::logger>("tessera", sinks.begin(), sinks.end());
        state.logger->set_level(spdlog::level::trace);  // Let sinks filter
        state.logger->flush_on(spdlog::level::warn);

        state.global_level = config.console_level;
        state.initialized = true;
    }

    info(log_category::CORE, "Logger initialized");
    if (!log_path.empty()) {
        info(log_category::CORE, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    if (state.logger) {
        state.logger->flush();
    }
    state.logger.reset();
    state.category_levels.clear();
    state.initialized = false;
}

bool Logger::is_initialized() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.initialized;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.category_levels[std::string(category)] = level;
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    auto it = state.category_levels.find(std::string(category));
    if (it != state.category_levels.end()) {
        return it->second;
    }
    return state.global_level;
}

void Logger::set_global_level(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.global_level = level;
}

LogLevel Logger::get_global_level() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.global_level;
}

void Logger::flush() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    if (state.logger) {
        state.logger->flush();
    }
}

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return true;
    }

    LogLevel category_level = state.global_level;
    auto it = state.category_levels.find(std::string(category));
    if (it != state.category_levels.end()) {
        category_level = it->second;
    }
    return static_cast<int>(level) >= static_cast<int>(category_level);
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized || !state.logger) {
        // Before initialization, use spdlog's default logger
        spdlog::log(to_spdlog_level(level), "[{}] {}", category, message);
        return;
    }

    state.logger->log(to_spdlog_level(level), "[{}] {}", category, message);
}

}  // namespace tessera::core
