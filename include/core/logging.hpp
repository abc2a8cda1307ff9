/**
 * @file logging.hpp
 * @brief spdlog logger factory shared by the library and the CLI
 * @details Every logger created through LoggerFactory writes to one shared
 *          set of sinks: a colour console sink on stderr (so stdout stays
 *          free for the CLI summary) and, when enabled, a single rotating log
 *          file. Reconfiguring replaces the sinks of loggers that already
 *          exist. The configured level is also applied to the default logger
 *          of the kcenon GlobalLoggerRegistry, which backs the LOG_* macros.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <kcenon/common/interfaces/logger_interface.h>

namespace dicom_stacker::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool consoleOutput = true;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;
    std::string fileName = "dicom_stacker.log";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 5 * 1024 * 1024;  // 5 MB
    size_t maxFiles = 3;
};

/// Parse "trace", "debug", "info", "warning" (or "warn"), "error", "critical" or "off"
LogLevel logLevelFromString(const std::string& name, LogLevel fallback = LogLevel::Info);

std::string toString(LogLevel level);

/// Matching level of the ecosystem logger used by the LOG_* macros
kcenon::common::interfaces::log_level toEcosystemLevel(LogLevel level);

class LoggerFactory {
public:
    /// Registered logger with the given name, created on first use
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    /**
     * @brief Apply a configuration to the shared sinks and all loggers
     *
     * A file sink that cannot be opened is skipped with a warning on the
     * default spdlog logger.
     */
    static void configure(const LogConfig& config);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    static const LogConfig& getConfig();

    /// Flush and drop every logger
    static void shutdown();

private:
    static std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config);

    static LogConfig config_;
    static std::vector<spdlog::sink_ptr> sinks_;
};

}  // namespace dicom_stacker::logging
