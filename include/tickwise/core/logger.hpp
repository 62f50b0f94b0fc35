// Tickwise Core
// logger.hpp - Process-wide spdlog front end tagged by subsystem

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace tickwise::core {

// Ordered from most to least verbose; values line up with spdlog::level
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Accepts the names used in the "debug.log_level" config key
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool enable_file = true;
    std::filesystem::path log_directory;  // Empty = <user data dir>/logs
    std::string log_filename = "tickwise.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool include_timestamps = true;
};

// Every message carries a subsystem tag (see log_category) and goes through
// one shared spdlog logger. Before initialize() spdlog's default logger is used.
class Logger {
public:
    Logger() = delete;

    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    // Threshold for the console sink; the file sink keeps its own level
    static void set_level(LogLevel level);
    [[nodiscard]] static LogLevel get_level();
    [[nodiscard]] static bool is_enabled(LogLevel level);

    static void flush();

    template<typename... Args>
    static void log(LogLevel level, std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
        if (!is_enabled(level)) {
            return;
        }
        write(level, tag, fmt::format(format, std::forward<Args>(args)...));
    }

private:
    static void write(LogLevel level, std::string_view tag, std::string_view message);
};

namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* SCHEDULER = "scheduler";
    inline constexpr const char* SIM = "sim";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace tickwise::core

#define TICKWISE_LOG(level, category, ...) \
    ::tickwise::core::Logger::log(::tickwise::core::LogLevel::level, category, __VA_ARGS__)

#define TICKWISE_LOG_TRACE(category, ...) TICKWISE_LOG(Trace, category, __VA_ARGS__)
#define TICKWISE_LOG_DEBUG(category, ...) TICKWISE_LOG(Debug, category, __VA_ARGS__)
#define TICKWISE_LOG_INFO(category, ...) TICKWISE_LOG(Info, category, __VA_ARGS__)
#define TICKWISE_LOG_WARN(category, ...) TICKWISE_LOG(Warn, category, __VA_ARGS__)
#define TICKWISE_LOG_ERROR(category, ...) TICKWISE_LOG(Error, category, __VA_ARGS__)
#define TICKWISE_LOG_CRITICAL(category, ...) TICKWISE_LOG(Critical, category, __VA_ARGS__)
