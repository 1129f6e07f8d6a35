#pragma once

/// @file logging.h
/// @brief spdlog wrapper shared by the analysis engine, commands and CLI
///
/// One process-wide logger is created lazily. Console output always goes to
/// stderr so the CLI can keep stdout for tree and statistics output; a
/// rotating file sink is added when `logging.file` is configured.

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace plotwise {

enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Parse a level name ("debug", "warn", ...); nullopt if unknown
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Canonical lower-case name of a level
std::string_view LogLevelName(LogLevel level);

struct LogConfig {
    std::string name = "plotwise";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] %v";

    /// Plain stderr sink instead of the colored one (pipes, CI logs)
    bool console_color = true;

    std::optional<std::string> file_path;
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/// @brief Create the global logger. Only the first call takes effect until
/// ShutdownLogging() is called.
void InitLogging(const LogConfig& config = {});

/// @brief Global logger, created with defaults on first use
std::shared_ptr<spdlog::logger> GetLogger();

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

void FlushLogs();
void ShutdownLogging();

/// @brief Raises or lowers the global level for the lifetime of the object
class ScopedLogLevel {
public:
    explicit ScopedLogLevel(LogLevel level);
    ~ScopedLogLevel();

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    LogLevel previous_;
};

#define PLOTWISE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::plotwise::GetLogger(), __VA_ARGS__)
#define PLOTWISE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::plotwise::GetLogger(), __VA_ARGS__)
#define PLOTWISE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::plotwise::GetLogger(), __VA_ARGS__)
#define PLOTWISE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::plotwise::GetLogger(), __VA_ARGS__)
#define PLOTWISE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::plotwise::GetLogger(), __VA_ARGS__)
#define PLOTWISE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::plotwise::GetLogger(), __VA_ARGS__)

}  // namespace plotwise
