#include "core/logging.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <kcenon/common/interfaces/global_logger_registry.h>

namespace dicom_stacker::logging {

LogConfig LoggerFactory::config_ = {};
std::vector<spdlog::sink_ptr> LoggerFactory::sinks_ = {};

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

void applyEcosystemLevel(LogLevel level) {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    if (logger) {
        logger->set_level(toEcosystemLevel(level));
    }
}

}  // anonymous namespace

LogLevel logLevelFromString(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

kcenon::common::interfaces::log_level toEcosystemLevel(LogLevel level) {
    using kcenon::common::interfaces::log_level;
    switch (level) {
        case LogLevel::Trace: return log_level::trace;
        case LogLevel::Debug: return log_level::debug;
        case LogLevel::Info: return log_level::info;
        case LogLevel::Warning: return log_level::warning;
        case LogLevel::Error: return log_level::error;
        case LogLevel::Critical: return log_level::critical;
        case LogLevel::Off: return log_level::off;
    }
    return log_level::info;
}

std::vector<spdlog::sink_ptr> LoggerFactory::buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.consoleOutput) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (config.enableFileLogging && !config.logDirectory.empty()) {
        auto logFile = config.logDirectory / config.fileName;
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), config.maxFileSize, config.maxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", logFile.string(), e.what());
        }
    }

    for (auto& sink : sinks) {
        sink->set_level(toSpdlog(config.level));
        sink->set_pattern(config.pattern);
    }
    return sinks;
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    if (auto existingLogger = spdlog::get(name)) {
        return existingLogger;
    }

    if (sinks_.empty()) {
        sinks_ = buildSinks(config_);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(toSpdlog(config_.level));
    spdlog::register_logger(logger);
    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    config_ = config;
    sinks_ = buildSinks(config_);

    spdlog::set_level(toSpdlog(config_.level));
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> logger) {
        logger->sinks() = sinks_;
        logger->set_level(toSpdlog(config_.level));
    });
    applyEcosystemLevel(config_.level);
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    spdlog::set_level(toSpdlog(level));

    for (auto& sink : sinks_) {
        sink->set_level(toSpdlog(level));
    }
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(toSpdlog(level));
    });
    applyEcosystemLevel(level);
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

const LogConfig& LoggerFactory::getConfig() {
    return config_;
}

void LoggerFactory::shutdown() {
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> logger) {
        logger->flush();
    });
    spdlog::drop_all();
    sinks_.clear();
}

}  // namespace dicom_stacker::logging
