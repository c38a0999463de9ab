#pragma once

#include <source_location>
#include <string>

namespace laneflow {

/// Severity, ordered from most to least verbose
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Destination for Logger output.
///
/// Install an implementation with Logger::setBackend() to forward laneflow's
/// diagnostics into a host application's own logging. Calls may arrive from
/// several threads at once when diagrams are laid out concurrently.
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @p message is already formatted and prefixed with the caller's function name
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace laneflow
