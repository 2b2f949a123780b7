#pragma once

/// @file logging.h
/// @brief wcopt logging utilities wrapping spdlog

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace wcopt {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
/// "critical", "off"); case-insensitive.
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Logging configuration
struct LogConfig {
    std::string name = "wcopt";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // Console output goes to stderr so command output on stdout stays parseable
    bool console_to_stderr = true;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "wcopt.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 3;
};

/// @brief Initialize the process logger. Later calls are ignored.
void InitLogging(const LogConfig& config = {});

/// @brief Get the process logger, initializing it with defaults if needed
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the log level
void SetLogLevel(LogLevel level);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

#define WCOPT_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::wcopt::GetLogger(), __VA_ARGS__)
#define WCOPT_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::wcopt::GetLogger(), __VA_ARGS__)
#define WCOPT_LOG_INFO(...) SPDLOG_LOGGER_INFO(::wcopt::GetLogger(), __VA_ARGS__)
#define WCOPT_LOG_WARN(...) SPDLOG_LOGGER_WARN(::wcopt::GetLogger(), __VA_ARGS__)
#define WCOPT_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::wcopt::GetLogger(), __VA_ARGS__)
#define WCOPT_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::wcopt::GetLogger(), __VA_ARGS__)

}  // namespace wcopt
