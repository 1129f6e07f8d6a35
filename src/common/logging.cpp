#include "common/logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace plotwise {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return std::nullopt;
}

std::string_view LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace:
            return "trace";
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
        case LogLevel::kCritical:
            return "critical";
        case LogLevel::kOff:
            return "off";
    }
    return "unknown";
}

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console_color) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    }
    if (config.file_path) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            *config.file_path, config.max_file_size, config.max_files));
    }

    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(ToSpdlog(config.level));
    g_logger->set_pattern(config.pattern);
    g_logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(g_logger);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        InitLogging();
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(ToSpdlog(level));
}

LogLevel GetLogLevel() {
    return static_cast<LogLevel>(GetLogger()->level());
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

ScopedLogLevel::ScopedLogLevel(LogLevel level) : previous_(GetLogLevel()) {
    SetLogLevel(level);
}

ScopedLogLevel::~ScopedLogLevel() {
    SetLogLevel(previous_);
}

}  // namespace plotwise
