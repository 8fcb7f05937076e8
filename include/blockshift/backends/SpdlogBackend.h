#pragma once

#include "blockshift/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace blockshift {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink with colored levels, plus an optional file sink
 * (`<logDir>/blockshift.log`). The LOG_LEVEL or SPDLOG_LEVEL environment
 * variable overrides the initial level.
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

}  // namespace blockshift
