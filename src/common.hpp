//===----------------------------------------------------------------------===//
//                         IOM Client
//
// common.hpp
//
// Common definitions for the IOM client
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <stdexcept>

namespace iomclient {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Forward declarations
class Session;
class SubmissionEngine;
class SchemaResolver;
class TableMarshaller;
class FrameWriter;
class FileTransfer;
struct SessionConfig;

// Logical server name the broker resolves workspaces against
constexpr const char* DEFAULT_SERVER_APP = "SASApp";

// Buffer and cursor defaults
constexpr size_t DEFAULT_FLUSH_BUFFER_SIZE = 2048;
constexpr int32_t DEFAULT_MAX_OPEN_ROWS = 100;
constexpr int32_t DEFAULT_PAGE_SIZE = 55;
constexpr int32_t DEFAULT_CACHE_SIZE = 1;

// Remote work tables and files used for staging
constexpr const char* STAGING_TABLE = "_iom_sd2df";
constexpr const char* STAGING_CSV_FILE = "iom_sd2df.csv";
constexpr const char* RESULT_HTML_FILE = "iom_results.html";

// Broker connection or workspace could not be established
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {}
};

// Operation attempted on a session that is not open
class SessionStateError : public std::runtime_error {
public:
    explicit SessionStateError(const std::string& msg) : std::runtime_error(msg) {}
};

// User cancelled a macro-variable prompt; the submission is abandoned
class PromptCancelled : public std::runtime_error {
public:
    explicit PromptCancelled(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace iomclient
