#pragma once

#include "laneflow/common/ILoggerBackend.h"

#include <fmt/format.h>

#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace laneflow {

/**
 * @brief Process-wide diagnostics sink for the layout passes
 *
 * Messages go to an ILoggerBackend. Unless one is injected with setBackend(),
 * a SpdlogBackend writing to stderr is created on first use. Every entry
 * point is safe to call from concurrent layouts; a message is always
 * delivered to the backend that was current when it was logged, even if
 * another thread replaces it meanwhile.
 *
 * Capture mode additionally keeps formatted lines in memory, which the tests
 * use to assert on pass summaries and rejection warnings.
 *
 * @code
 * laneflow::Logger::initialize("logs");
 * laneflow::Logger::setLevel(laneflow::LogLevel::Debug);
 * LOG_DEBUG("Routed {} edges", graph.edgeCount());
 * @endcode
 */
class Logger {
public:
    /// Replace the backend. Passing nullptr restores the lazy default.
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Install the stderr SpdlogBackend unless a backend is already set
    static void initialize();

    /// Same, with an additional laneflow.log file sink under @p logDir
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // In-memory capture

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /// Captured lines containing @p pattern, keeping the newest @p maxLines (0 keeps all)
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    /// Current backend, creating the default one if none is set
    static std::shared_ptr<ILoggerBackend> backend();
    static void dispatch(LogLevel level, const char* tag, const std::string& message,
                         const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace laneflow

// fmt-style logging macros; the message is prefixed with the calling function
#define LOG_TRACE(...) laneflow::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) laneflow::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  laneflow::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  laneflow::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) laneflow::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
