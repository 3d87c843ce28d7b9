//===----------------------------------------------------------------------===//
//                         IOM Client
//
// logging/logger.hpp
//
// Process logging based on spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace iomclient {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

class Logger {
public:
    static constexpr const char* LOG_FILE_ENV = "IOMCLIENT_LOG_FILE";
    static constexpr const char* LOG_LEVEL_ENV = "IOMCLIENT_LOG_LEVEL";

    // Initialize logging system. Only the first call takes effect.
    static void Initialize(const std::string& log_file = "",
                          const std::string& log_level = "info");

    // Initialize from IOMCLIENT_LOG_FILE / IOMCLIENT_LOG_LEVEL; used when
    // the first log call arrives before Initialize()
    static void InitializeFromEnvironment();

    static void Shutdown();

    // Get the main logger instance (auto-initializes from the environment)
    static std::shared_ptr<spdlog::logger>& Get();

    static void SetLevel(LogLevel level);
    static void SetLevel(const std::string& level);

    // Attach an extra sink, e.g. for capturing output in tests
    static void AddSink(spdlog::sink_ptr sink);

    static void Flush();

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
};

} // namespace iomclient

// LOG_INFO("component", "message " + std::to_string(x))
#define LOG_TRACE(component, message) \
    do { \
        if (iomclient::Logger::Get()->should_log(spdlog::level::trace)) \
            iomclient::Logger::Get()->trace("[{}] {}", component, message); \
    } while(0)

#define LOG_DEBUG(component, message) \
    do { \
        if (iomclient::Logger::Get()->should_log(spdlog::level::debug)) \
            iomclient::Logger::Get()->debug("[{}] {}", component, message); \
    } while(0)

#define LOG_INFO(component, message) \
    do { \
        if (iomclient::Logger::Get()->should_log(spdlog::level::info)) \
            iomclient::Logger::Get()->info("[{}] {}", component, message); \
    } while(0)

#define LOG_WARN(component, message) \
    do { \
        if (iomclient::Logger::Get()->should_log(spdlog::level::warn)) \
            iomclient::Logger::Get()->warn("[{}] {}", component, message); \
    } while(0)

#define LOG_ERROR(component, message) \
    do { \
        if (iomclient::Logger::Get()->should_log(spdlog::level::err)) \
            iomclient::Logger::Get()->error("[{}] {}", component, message); \
    } while(0)

#define LOG_FATAL(component, message) \
    do { \
        if (iomclient::Logger::Get()->should_log(spdlog::level::critical)) \
            iomclient::Logger::Get()->critical("[{}] {}", component, message); \
    } while(0)

// ILOG_INFO("component", "opened {} rows", n)
#define ILOG_TRACE(component, fmt, ...) \
    iomclient::Logger::Get()->trace("[{}] " fmt, component, ##__VA_ARGS__)
#define ILOG_DEBUG(component, fmt, ...) \
    iomclient::Logger::Get()->debug("[{}] " fmt, component, ##__VA_ARGS__)
#define ILOG_INFO(component, fmt, ...) \
    iomclient::Logger::Get()->info("[{}] " fmt, component, ##__VA_ARGS__)
#define ILOG_WARN(component, fmt, ...) \
    iomclient::Logger::Get()->warn("[{}] " fmt, component, ##__VA_ARGS__)
#define ILOG_ERROR(component, fmt, ...) \
    iomclient::Logger::Get()->error("[{}] " fmt, component, ##__VA_ARGS__)
