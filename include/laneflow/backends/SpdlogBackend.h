#pragma once

#include "laneflow/common/ILoggerBackend.h"

#include <memory>
#include <spdlog/spdlog.h>

namespace laneflow {

/**
 * @brief spdlog-based logger backend
 *
 * Colored stderr sink by default; adds a file sink (laneflow.log) when a log
 * directory is given. The level can be overridden with the LOG_LEVEL or
 * SPDLOG_LEVEL environment variables.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace laneflow
