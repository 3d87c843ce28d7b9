//===----------------------------------------------------------------------===//
//                         IOM Client
//
// logging/logger.cpp
//
// Logger implementation using spdlog
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <vector>

namespace iomclient {

std::shared_ptr<spdlog::logger> Logger::logger_;
bool Logger::initialized_ = false;

void Logger::Initialize(const std::string& log_file, const std::string& log_level) {
    if (initialized_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console goes to stderr so that listing output on stdout stays clean
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file,
            100 * 1024 * 1024,  // 100 MB max file size
            3                    // Keep 3 rotated files
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("iomclient", sinks.begin(), sinks.end());
    logger_->set_level(ToSpdlogLevel(log_level));
    logger_->flush_on(spdlog::level::warn);

    initialized_ = true;
}

void Logger::Shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    initialized_ = false;
}

void Logger::InitializeFromEnvironment() {
    const char* file = std::getenv(LOG_FILE_ENV);
    const char* level = std::getenv(LOG_LEVEL_ENV);
    Initialize(file ? file : "", level ? level : "info");
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        InitializeFromEnvironment();
    }
    return logger_;
}

void Logger::SetLevel(LogLevel level) {
    Get()->set_level(ToSpdlogLevel(level));
}

void Logger::SetLevel(const std::string& level) {
    Get()->set_level(ToSpdlogLevel(level));
}

void Logger::AddSink(spdlog::sink_ptr sink) {
    Get()->sinks().push_back(std::move(sink));
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::FATAL: return spdlog::level::critical;
        default:              return spdlog::level::info;
    }
}

spdlog::level::level_enum Logger::ToSpdlogLevel(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info")  return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "fatal" || lower == "critical") return spdlog::level::critical;

    return spdlog::level::info;
}

} // namespace iomclient
