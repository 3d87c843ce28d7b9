//===----------------------------------------------------------------------===//
//                         IOM Client
//
// session/session.hpp
//
// Session manager: owns the remote workspace and data connection
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "broker/broker.hpp"
#include "config/session_config.hpp"

namespace iomclient {

enum class SessionState {
    UNOPENED,
    OPEN,
    ERROR,   // last submission reported errors; cleared by ResetParser()
    CLOSED
};

const char* SessionStateToString(SessionState state);

class Session {
public:
    Session(std::shared_ptr<broker::ObjectBroker> broker_p, SessionConfig config_p);

    // Closes the connection and workspace if still open
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Establish the workspace and data connection. A no-op returning the
    // existing identifier when already open. Broker failures surface as
    // ConnectionError; nothing is retried.
    const std::string& Open();

    // Close connection, release the workspace from the broker registry,
    // then close the workspace. Every step runs and the session ends CLOSED
    // even when one fails; the first failure is rethrown afterwards. Safe
    // to call repeatedly.
    void Close();

    bool IsOpen() const { return workspace != nullptr; }
    SessionState GetState() const { return state; }
    const std::string& GetWorkspaceId() const { return workspace_id; }
    const SessionConfig& GetConfig() const { return config; }
    TimePoint GetCreatedAt() const { return created_at; }

    //===------------------------------------------------------------------===//
    // Language service
    //===------------------------------------------------------------------===//

    void Submit(const std::string& code);

    // Drain the pending log; the result is also appended to the session log
    std::string FlushLog();
    std::string FlushListing();

    // Release the token scanner from any error state
    void ResetParser();

    // Record that the last submission left errors in the log
    void MarkError();

    // Every log line retrieved over the session's lifetime
    const std::string& GetSessionLog() const { return session_log; }

    //===------------------------------------------------------------------===//
    // File service
    //===------------------------------------------------------------------===//

    std::string ReadRemoteFile(const std::string& path);
    void WriteRemoteFile(const std::string& path, const std::string& bytes,
                         const std::string& options = "");

    //===------------------------------------------------------------------===//
    // Data connection
    //===------------------------------------------------------------------===//

    std::unique_ptr<broker::RowCursor> OpenColumnSchema(const std::string& table_path);
    std::unique_ptr<broker::RowCursor> OpenTableCursor(const std::string& table);
    void Execute(const std::string& statement);

private:
    broker::Workspace& RequireWorkspace();
    broker::DataConnection& RequireConnection();
    void Teardown();

private:
    std::shared_ptr<broker::ObjectBroker> broker;
    SessionConfig config;

    std::shared_ptr<broker::Workspace> workspace;
    std::unique_ptr<broker::DataConnection> connection;
    std::string workspace_id;

    SessionState state = SessionState::UNOPENED;
    std::string session_log;
    TimePoint created_at;
};

} // namespace iomclient
