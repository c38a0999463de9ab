#include "laneflow/backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace laneflow {

namespace {

constexpr const char* LOGGER_NAME = "laneflow";
constexpr const char* LOG_FILE_NAME = "laneflow.log";

/// Level requested through LOG_LEVEL (or SPDLOG_LEVEL), if any is recognized
std::optional<spdlog::level::level_enum> levelFromEnvironment() {
    const char* value = std::getenv("LOG_LEVEL");
    if (!value) {
        value = std::getenv("SPDLOG_LEVEL");
    }
    if (!value) {
        return std::nullopt;
    }

    std::string name(value);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // from_str maps unknown names to "off"; only honour an explicit "off"
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

std::vector<spdlog::sink_ptr> makeSinks(const std::string& logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        const auto path = std::filesystem::path(logDir) / LOG_FILE_NAME;

        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file);
    }
    return sinks;
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    // The registry rejects duplicate names, so a second backend shares the first logger
    logger_ = spdlog::get(LOGGER_NAME);
    if (!logger_) {
        auto sinks = makeSinks(logDir, logToFile);
        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(logger_);
    }

    // Layout passes log at debug; keep the console quiet unless asked
    logger_->set_level(levelFromEnvironment().value_or(spdlog::level::info));
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        const std::source_location& loc) {
    if (!logger_) {
        return;
    }
    const spdlog::source_loc where{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    logger_->log(where, convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace laneflow
