#include "blockshift/common/Logger.h"
#include "blockshift/backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace blockshift {

namespace {

std::unique_ptr<ILoggerBackend> backend;
std::mutex backendMutex;

bool captureEnabled = false;
std::vector<std::string> capturedLogs;
std::mutex captureMutex;

// Caller must hold backendMutex for as long as the reference is used
ILoggerBackend& activeBackend() {
    if (!backend) {
        backend = std::make_unique<SpdlogBackend>();
    }
    return *backend;
}

}  // namespace

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> newBackend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend = std::move(newBackend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend) {
        backend = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend) {
        backend = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(backendMutex);
    activeBackend().setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(backendMutex);
    activeBackend().flush();
}

void Logger::write(LogLevel level, const std::string& message,
                   const std::source_location& loc) {
    std::string enhanced = extractFunctionName(loc) + "() - " + message;
    {
        std::lock_guard<std::mutex> lock(backendMutex);
        activeBackend().log(level, enhanced, loc);
    }

    std::lock_guard<std::mutex> lock(captureMutex);
    if (captureEnabled) {
        capturedLogs.push_back(std::string("[") + logLevelName(level) + "] " + enhanced);
    }
}

// ===== Log Capture Implementation =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(captureMutex);
    captureEnabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(captureMutex);
    return captureEnabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(captureMutex);

    std::vector<std::string> result;
    for (const auto& line : capturedLogs) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(result.size() - maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex);
    capturedLogs.clear();
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "Unknown";
    }

    // Last space outside template brackets marks the start of the qualified name
    int angleDepth = 0;
    size_t nameStart = 0;
    for (size_t i = 0; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') angleDepth++;
        else if (c == '>') angleDepth--;
        else if (c == ' ' && angleDepth == 0) nameStart = i + 1;
    }

    std::string result;
    angleDepth = 0;
    for (size_t i = nameStart; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') angleDepth++;
        else if (c == '>') angleDepth--;
        else if (angleDepth == 0) result += c;
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

}  // namespace blockshift
