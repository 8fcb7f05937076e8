#pragma once

#include "blockshift/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace blockshift {

/**
 * @brief Process-wide logging facade used by every engine component
 *
 * - Default mode: spdlog console backend, created lazily on first use
 * - Custom mode: the host injects its own ILoggerBackend
 * - Capture mode: messages are also kept in memory for tests and diagnostics
 *
 * Thread-safe. The engine itself is single-threaded, but hosts may log from
 * other threads through the same facade.
 *
 * Example:
 * @code
 * blockshift::Logger::initialize();
 * LOG_INFO("session started on node {}", nodeId);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend Host's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout only)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
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

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable in-memory capture
     *
     * Captured lines have the form "[level] function() - message".
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Optional substring filter (empty = all logs)
     * @param maxLines Maximum number of lines to return, newest kept (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
};

}  // namespace blockshift

// Logging macros with std::format support
#define LOG_TRACE(...) blockshift::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) blockshift::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  blockshift::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  blockshift::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) blockshift::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
