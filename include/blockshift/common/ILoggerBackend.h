#pragma once

#include <source_location>
#include <string>

namespace blockshift {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

const char* logLevelName(LogLevel level);

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding the engine route its diagnostics into their own logging
 * system by implementing this interface.
 *
 * Example:
 * @code
 * class EditorLog : public blockshift::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         console_->append(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { console_->setMinLevel(level); }
 *     void flush() override {}
 * };
 *
 * blockshift::Logger::setBackend(std::make_unique<EditorLog>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     * @param level Log level
     * @param message Pre-formatted message
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /**
     * @brief Set minimum log level
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace blockshift
