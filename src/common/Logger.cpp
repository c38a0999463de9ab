#include "laneflow/common/Logger.h"
#include "laneflow/backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>
#include <utility>

namespace laneflow {

namespace {

// Guarded by backend_mutex. Loggers take a shared copy and log outside the
// lock, so a concurrent setBackend() never destroys a backend still in use.
std::shared_ptr<ILoggerBackend> current_backend;
std::mutex backend_mutex;

bool capture_enabled = false;
std::vector<std::string> captured_logs;
std::mutex capture_mutex;

}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::shared_ptr<ILoggerBackend> replaced;  // released outside the lock
    {
        std::lock_guard<std::mutex> lock(backend_mutex);
        replaced = std::exchange(current_backend, std::move(backend));
    }
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!current_backend) {
        current_backend = std::make_shared<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!current_backend) {
        current_backend = std::make_shared<SpdlogBackend>(logDir, logToFile);
    }
}

std::shared_ptr<ILoggerBackend> Logger::backend() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!current_backend) {
        current_backend = std::make_shared<SpdlogBackend>();
    }
    return current_backend;
}

void Logger::setLevel(LogLevel level) {
    backend()->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Trace, "[trace] ", message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Debug, "[debug] ", message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Info, "[info] ", message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Warn, "[warn] ", message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Error, "[error] ", message, loc);
}

void Logger::flush() {
    backend()->flush();
}

void Logger::dispatch(LogLevel level, const char* tag, const std::string& message,
                      const std::source_location& loc) {
    std::string enhanced = extractFunctionName(loc) + "() - " + message;
    backend()->log(level, enhanced, loc);
    captureLog(tag + enhanced);
}

// Capture

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(capture_mutex);
    capture_enabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(capture_mutex);
    return capture_enabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(capture_mutex);

    std::vector<std::string> result;
    for (const auto& line : captured_logs) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    // Keep the most recent lines
    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + static_cast<long>(result.size() - maxLines));
    }

    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(capture_mutex);
    captured_logs.clear();
}

void Logger::captureLog(const std::string& message) {
    std::lock_guard<std::mutex> lock(capture_mutex);
    if (capture_enabled) {
        captured_logs.push_back(message);
    }
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "Unknown";
    }

    // Last space before the parenthesis, ignoring template arguments
    int angle_count = 0;
    size_t last_space = std::string::npos;
    for (size_t i = 0; i < paren_pos; ++i) {
        char c = full_name[i];
        if (c == '<') angle_count++;
        else if (c == '>') angle_count--;
        else if (c == ' ' && angle_count == 0) last_space = i;
    }

    size_t name_start = (last_space != std::string::npos) ? last_space + 1 : 0;
    std::string qualified = full_name.substr(name_start, paren_pos - name_start);

    std::string result;
    angle_count = 0;
    for (char c : qualified) {
        if (c == '<') angle_count++;
        else if (c == '>') angle_count--;
        else if (angle_count == 0) result += c;
    }

    while (!result.empty() && (std::isspace(static_cast<unsigned char>(result[0])) ||
                               result[0] == '*' || result[0] == '&')) {
        result.erase(0, 1);
    }
    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "Unknown" : result;
}

}  // namespace laneflow
