// Tickwise Core
// logger.cpp - Shared spdlog logger with console and rotating file sinks

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>
#include <tickwise/core/logger.hpp>
#include <tickwise/platform/file_io.hpp>

namespace tickwise::core {

namespace {

struct LoggerState {
    bool initialized = false;
    LogLevel console_level = LogLevel::Info;
    std::optional<LogLevel> file_level;  // Unset when no file sink is attached
    std::shared_ptr<spdlog::logger> logger;  // sinks()[0] is the console
    std::mutex mutex;
};

LoggerState& get_state() {
    static LoggerState state;
    return state;
}

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

spdlog::sink_ptr make_console_sink(const LoggerConfig& config) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_level(to_spdlog_level(config.console_level));
    sink->set_pattern(config.include_timestamps ? "[%H:%M:%S] [%^%l%$] %v" : "[%^%l%$] %v");
    return sink;
}

// The logger lets through anything at least one sink will accept
void apply_logger_level(LoggerState& state) {
    LogLevel threshold = state.console_level;
    if (state.file_level && *state.file_level < threshold) {
        threshold = *state.file_level;
    }
    state.logger->set_level(to_spdlog_level(threshold));
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "trace") {
        return LogLevel::Trace;
    }
    if (name == "debug") {
        return LogLevel::Debug;
    }
    if (name == "info") {
        return LogLevel::Info;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::Warn;
    }
    if (name == "error") {
        return LogLevel::Error;
    }
    if (name == "critical") {
        return LogLevel::Critical;
    }
    if (name == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;  // Reported after the lock is released

    {
        std::lock_guard lock(state.mutex);

        if (state.initialized) {
            return;
        }

        std::vector<spdlog::sink_ptr> sinks{make_console_sink(config)};
        state.file_level.reset();

        if (config.enable_file) {
            try {
                std::filesystem::path log_dir = config.log_directory;
                if (log_dir.empty()) {
                    log_dir = platform::FileSystem::get_user_data_directory() / "logs";
                }
                if (!platform::FileSystem::exists(log_dir)) {
                    platform::FileSystem::create_directories(log_dir);
                }

                log_path = log_dir / config.log_filename;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), config.max_file_size, config.max_files);
                file_sink->set_level(to_spdlog_level(config.file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(std::move(file_sink));
                state.file_level = config.file_level;
            } catch (const spdlog::spdlog_ex& ex) {
                // Keep console logging when the file cannot be opened
                spdlog::error("Log file unavailable: {}", ex.what());
                log_path.clear();
            }
        }

        state.logger = std::make_shared<spdlog::logger>("tickwise", sinks.begin(), sinks.end());
        state.logger->flush_on(spdlog::level::warn);
        state.console_level = config.console_level;
        apply_logger_level(state);
        state.initialized = true;
    }

    log(LogLevel::Info, log_category::ENGINE, "Logger initialized");
    if (!log_path.empty()) {
        log(LogLevel::Info, log_category::ENGINE, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    state.logger->flush();
    state.logger.reset();
    state.console_level = LogLevel::Info;
    state.file_level.reset();
    state.initialized = false;
}

bool Logger::is_initialized() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.initialized;
}

void Logger::set_level(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.console_level = level;

    if (state.logger) {
        state.logger->sinks().front()->set_level(to_spdlog_level(level));
        apply_logger_level(state);
    }
}

LogLevel Logger::get_level() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.console_level;
}

bool Logger::is_enabled(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return spdlog::default_logger_raw()->should_log(to_spdlog_level(level));
    }
    return state.logger->should_log(to_spdlog_level(level));
}

void Logger::flush() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (state.logger) {
        state.logger->flush();
    }
}

void Logger::write(LogLevel level, std::string_view tag, std::string_view message) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        spdlog::log(to_spdlog_level(level), "[{}] {}", tag, message);
        return;
    }

    state.logger->log(to_spdlog_level(level), "[{}] {}", tag, message);
}

}  // namespace tickwise::core
