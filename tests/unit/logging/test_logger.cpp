//===----------------------------------------------------------------------===//
//                         IOM Client - Unit Tests
//
// tests/unit/logging/test_logger.cpp
//
// Unit tests for Logger
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include "config/session_config.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>

using namespace iomclient;

// Route process logging into a string stream for inspection
static std::shared_ptr<std::ostringstream> CaptureLog(const std::string& level) {
    Logger::Shutdown();
    Logger::Initialize("", level);
    auto stream = std::make_shared<std::ostringstream>();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*stream);
    sink->set_pattern("%l %v");
    Logger::AddSink(sink);
    return stream;
}

//===----------------------------------------------------------------------===//
// Level Parsing Tests
//===----------------------------------------------------------------------===//

void TestLevelNames() {
    std::cout << "  Testing level names..." << std::endl;

    assert(Logger::ToSpdlogLevel("trace") == spdlog::level::trace);
    assert(Logger::ToSpdlogLevel("Debug") == spdlog::level::debug);
    assert(Logger::ToSpdlogLevel("INFO") == spdlog::level::info);
    assert(Logger::ToSpdlogLevel("warning") == spdlog::level::warn);
    assert(Logger::ToSpdlogLevel("error") == spdlog::level::err);
    assert(Logger::ToSpdlogLevel("critical") == spdlog::level::critical);
    assert(Logger::ToSpdlogLevel("fatal") == spdlog::level::critical);

    // Anything else falls back to info
    assert(Logger::ToSpdlogLevel("verbose") == spdlog::level::info);
    assert(Logger::ToSpdlogLevel("") == spdlog::level::info);

    assert(Logger::ToSpdlogLevel(LogLevel::FATAL) == spdlog::level::critical);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Lifecycle Tests
//===----------------------------------------------------------------------===//

void TestAutoInitialize() {
    std::cout << "  Testing auto-initialization..." << std::endl;

    unsetenv(Logger::LOG_LEVEL_ENV);
    unsetenv(Logger::LOG_FILE_ENV);
    Logger::Shutdown();
    auto& logger = Logger::Get();
    assert(logger != nullptr);
    assert(logger->level() == spdlog::level::info);
    assert(logger->name() == "iomclient");

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestEnvironmentInitialize() {
    std::cout << "  Testing initialization from the environment..." << std::endl;

    setenv(Logger::LOG_LEVEL_ENV, "Debug", 1);
    Logger::Shutdown();
    assert(Logger::Get()->level() == spdlog::level::debug);
    assert(Logger::Get()->sinks().size() == 1);

    unsetenv(Logger::LOG_LEVEL_ENV);
    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestInitializeIsOnce() {
    std::cout << "  Testing repeated Initialize keeps the first settings..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "trace");
    Logger::Initialize("", "error");
    assert(Logger::Get()->level() == spdlog::level::trace);

    Logger::SetLevel("warn");
    assert(Logger::Get()->level() == spdlog::level::warn);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestRotatingFileSink() {
    std::cout << "  Testing file sink..." << std::endl;

    std::string path = "/tmp/iomclient_test_logger.log";
    std::filesystem::remove(path);

    Logger::Shutdown();
    Logger::Initialize(path, "debug");
    LOG_DEBUG("session", "workspace ws-1 opened");
    ILOG_INFO("transfer", "{} bytes", 1024);
    Logger::Shutdown();

    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    assert(content.find("[session] workspace ws-1 opened") != std::string::npos);
    assert(content.find("[transfer] 1024 bytes") != std::string::npos);

    std::filesystem::remove(path);
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Macro Tests
//===----------------------------------------------------------------------===//

void TestMacrosRespectLevel() {
    std::cout << "  Testing macros respect the level..." << std::endl;

    auto captured = CaptureLog("warn");
    LOG_DEBUG("submit", "hidden debug");
    LOG_INFO("submit", "hidden info");
    LOG_WARN("submit", "shown warning");
    ILOG_ERROR("submit", "shown {}", "error");
    Logger::Flush();

    std::string text = captured->str();
    assert(text.find("hidden") == std::string::npos);
    assert(text.find("warning [submit] shown warning") != std::string::npos);
    assert(text.find("error [submit] shown error") != std::string::npos);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestLockedOverrideWarns() {
    std::cout << "  Testing rejected override is logged..." << std::endl;

    auto captured = CaptureLog("info");
    SessionConfig config;
    config.lock_down = true;
    assert(!config.TryOverride("cachesize", "10"));
    Logger::Flush();

    assert(captured->str().find("Param 'cachesize' was ignored due to configuration restriction") !=
           std::string::npos);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Logger Unit Tests ===" << std::endl;

    std::cout << "\n1. Level Parsing Tests:" << std::endl;
    TestLevelNames();

    std::cout << "\n2. Lifecycle Tests:" << std::endl;
    TestAutoInitialize();
    TestEnvironmentInitialize();
    TestInitializeIsOnce();
    TestRotatingFileSink();

    std::cout << "\n3. Macro Tests:" << std::endl;
    TestMacrosRespectLevel();
    TestLockedOverrideWarns();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
