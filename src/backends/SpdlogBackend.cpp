#include "blockshift/backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace blockshift {

namespace {

constexpr const char* kLoggerName = "blockshift";

std::shared_ptr<spdlog::logger> makeLogger(const std::string& logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "blockshift.log";

        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            logPath.string(), true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(fileSink);
    }

    // A host may have created a logger with the same name already
    if (spdlog::get(kLoggerName)) {
        spdlog::drop(kLoggerName);
    }
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    return logger;
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile)
    : logger_(makeLogger(logDir, logToFile)) {
    logger_->set_level(spdlog::level::info);

    const char* envLevel = std::getenv("LOG_LEVEL");
    if (!envLevel) {
        envLevel = std::getenv("SPDLOG_LEVEL");
    }

    if (envLevel) {
        std::string levelStr(envLevel);
        std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (levelStr == "trace") logger_->set_level(spdlog::level::trace);
        else if (levelStr == "debug") logger_->set_level(spdlog::level::debug);
        else if (levelStr == "info") logger_->set_level(spdlog::level::info);
        else if (levelStr == "warn" || levelStr == "warning") logger_->set_level(spdlog::level::warn);
        else if (levelStr == "err" || levelStr == "error") logger_->set_level(spdlog::level::err);
        else if (levelStr == "critical") logger_->set_level(spdlog::level::critical);
        else if (levelStr == "off") logger_->set_level(spdlog::level::off);
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
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

}  // namespace blockshift
