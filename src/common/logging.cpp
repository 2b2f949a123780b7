#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>

namespace wcopt {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_mutex;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lower == "trace") return LogLevel::kTrace;
    if (lower == "debug") return LogLevel::kDebug;
    if (lower == "info") return LogLevel::kInfo;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error") return LogLevel::kError;
    if (lower == "critical") return LogLevel::kCritical;
    if (lower == "off") return LogLevel::kOff;
    return std::nullopt;
}

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        return;
    }
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_to_stderr) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(ToSpdlog(config.level));
        sinks.push_back(console_sink);
    } else {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(ToSpdlog(config.level));
        sinks.push_back(console_sink);
    }

    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(ToSpdlog(config.level));
        sinks.push_back(file_sink);
    }

    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(ToSpdlog(config.level));
    g_logger->set_pattern(config.pattern);
    g_logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(g_logger);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    InitLogging();
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    auto logger = GetLogger();
    logger->set_level(ToSpdlog(level));
    for (auto& sink : logger->sinks()) {
        sink->set_level(ToSpdlog(level));
    }
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace wcopt
