#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dicom_transfer::logging {

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
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 5 * 1024 * 1024;  // 5 MB
    size_t maxFiles = 3;
};

/// Parse "trace", "debug", "info", "warning", "error", "critical" or "off"
std::optional<LogLevel> parseLogLevel(std::string_view name);

std::string_view toString(LogLevel level);

class LoggerFactory {
public:
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    static void configure(const LogConfig& config);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    static void shutdown();

private:
    static LogConfig config_;
    static bool configured_;
};

}  // namespace dicom_transfer::logging
