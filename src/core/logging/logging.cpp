#include "core/logging.hpp"

#include <array>
#include <utility>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dicom_transfer::logging {

namespace {

constexpr std::array<std::pair<std::string_view, LogLevel>, 7> kLevelNames{{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warning", LogLevel::Warning},
    {"error", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"off", LogLevel::Off},
}};

}  // namespace

LogConfig LoggerFactory::config_ = {};
bool LoggerFactory::configured_ = false;

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    for (const auto& [levelName, level] : kLevelNames) {
        if (levelName == name) {
            return level;
        }
    }
    if (name == "warn") {
        return LogLevel::Warning;
    }
    return std::nullopt;
}

std::string_view toString(LogLevel level) {
    for (const auto& [levelName, candidate] : kLevelNames) {
        if (candidate == level) {
            return levelName;
        }
    }
    return "info";
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    auto existingLogger = spdlog::get(name);
    if (existingLogger) {
        return existingLogger;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // stdout carries the CLI's own report, so diagnostics go to stderr
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(static_cast<spdlog::level::level_enum>(config_.level));
    sinks.push_back(consoleSink);

    if (config_.enableFileLogging && !config_.logDirectory.empty()) {
        auto logFile = config_.logDirectory / (name + ".log");
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(),
            config_.maxFileSize,
            config_.maxFiles
        );
        fileSink->set_level(static_cast<spdlog::level::level_enum>(config_.level));
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(static_cast<spdlog::level::level_enum>(config_.level));
    logger->set_pattern(config_.pattern);

    spdlog::register_logger(logger);

    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    config_ = config;
    configured_ = true;

    spdlog::set_level(static_cast<spdlog::level::level_enum>(config.level));
    spdlog::set_pattern(config.pattern);

    // Loggers created before configure() keep their sinks; only the level follows
    spdlog::apply_all([&config](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(static_cast<spdlog::level::level_enum>(config.level));
        for (auto& sink : logger->sinks()) {
            sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
        }
    });
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(static_cast<spdlog::level::level_enum>(level));
        for (auto& sink : logger->sinks()) {
            sink->set_level(static_cast<spdlog::level::level_enum>(level));
        }
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

void LoggerFactory::shutdown() {
    spdlog::shutdown();
    configured_ = false;
}

}  // namespace dicom_transfer::logging
