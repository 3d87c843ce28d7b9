//===----------------------------------------------------------------------===//
//                         IOM Client
//
// session/session.cpp
//
// Session lifecycle and delegated access to the workspace
//===----------------------------------------------------------------------===//

#include "session/session.hpp"
#include "transfer/stream_pump.hpp"
#include "logging/logger.hpp"

#include <exception>

namespace iomclient {

namespace {

constexpr const char* READ_FILEREF = "_iomout";
constexpr const char* WRITE_FILEREF = "_iomin";
constexpr int32_t WORKSPACE_KEEPER_ID = 1;
constexpr const char* WORKSPACE_KEEPER_NAME = "WorkspaceObject";

// Deassigns a fileref when the transfer scope ends
class FilerefScope {
public:
    FilerefScope(broker::FileService& files_p, std::string name_p)
        : files(files_p), name(std::move(name_p)) {}

    ~FilerefScope() {
        try {
            files.DeassignFileref(name);
        } catch (const std::exception& e) {
            LOG_ERROR("session", "Failed to deassign fileref " + name + ": " + e.what());
        }
    }

    FilerefScope(const FilerefScope&) = delete;
    FilerefScope& operator=(const FilerefScope&) = delete;

private:
    broker::FileService& files;
    std::string name;
};

// Closes a binary stream on every exit path
class StreamScope {
public:
    explicit StreamScope(std::unique_ptr<broker::BinaryStream> stream_p)
        : stream(std::move(stream_p)) {}

    ~StreamScope() {
        if (!stream) {
            return;
        }
        try {
            stream->Close();
        } catch (const std::exception& e) {
            LOG_ERROR("session", std::string("Failed to close binary stream: ") + e.what());
        }
    }

    StreamScope(const StreamScope&) = delete;
    StreamScope& operator=(const StreamScope&) = delete;

    broker::BinaryStream& operator*() { return *stream; }

    // Close explicitly so that close failures propagate on the success path
    void Close() {
        auto s = std::move(stream);
        s->Close();
    }

private:
    std::unique_ptr<broker::BinaryStream> stream;
};

} // anonymous namespace

const char* SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::UNOPENED: return "unopened";
        case SessionState::OPEN:     return "open";
        case SessionState::ERROR:    return "error";
        case SessionState::CLOSED:   return "closed";
        default:                     return "unknown";
    }
}

Session::Session(std::shared_ptr<broker::ObjectBroker> broker_p, SessionConfig config_p)
    : broker(std::move(broker_p))
    , config(std::move(config_p))
    , created_at(Clock::now()) {
    if (!broker) {
        throw std::invalid_argument("Session requires an object broker");
    }
}

Session::~Session() {
    try {
        Close();
    } catch (const std::exception& e) {
        LOG_ERROR("session", std::string("Session teardown failed: ") + e.what());
    }
}

const std::string& Session::Open() {
    if (workspace) {
        return workspace_id;
    }
    if (state == SessionState::CLOSED) {
        throw SessionStateError("Session has been closed and cannot be reopened");
    }

    std::string error;
    if (!config.Validate(error)) {
        throw ConnectionError("Invalid session configuration: " + error);
    }

    broker::ServerDef server;
    std::optional<std::string> user;
    std::optional<std::string> password;

    if (!config.IsRemote()) {
        // Local loopback workspace, no credentials
        server.machine_dns_name = "127.0.0.1";
        server.port = 0;
        server.protocol = broker::Protocol::COM;
    } else {
        server.machine_dns_name = *config.host;
        server.port = config.port;
        server.protocol = broker::Protocol::IOM;
        server.class_identifier = config.class_id;
        user = config.user;
        password = config.password;
    }

    ILOG_INFO("session", "Opening workspace on {}:{} ({})", server.machine_dns_name, server.port,
              config.IsRemote() ? "remote" : "local");

    try {
        workspace = broker->CreateWorkspace(DEFAULT_SERVER_APP, server, user, password);
        if (!workspace) {
            throw ConnectionError("Broker returned no workspace");
        }
        workspace_id = workspace->UniqueIdentifier();
        broker->KeepWorkspace(WORKSPACE_KEEPER_ID, WORKSPACE_KEEPER_NAME, workspace);

        connection = broker->NewDataConnection();
        if (!connection) {
            throw ConnectionError("Broker returned no data connection");
        }
        connection->Open("Provider=" + config.provider + "; Data Source=iom-id://" + workspace_id);
    } catch (const std::exception& e) {
        std::string reason = e.what();
        Teardown();
        throw ConnectionError("Failed to open workspace on " + server.machine_dns_name + ": " + reason);
    }

    state = SessionState::OPEN;
    LOG_INFO("session", "Workspace " + workspace_id + " opened");
    return workspace_id;
}

void Session::Close() {
    if (!workspace) {
        if (state != SessionState::UNOPENED) {
            state = SessionState::CLOSED;
        }
        return;
    }

    std::string id = workspace_id;
    std::exception_ptr first_error;

    // Order matters: connection, registry, then the workspace itself. Every
    // step runs even when an earlier one fails; the first failure is rethrown.
    try {
        if (connection && connection->IsOpen()) {
            connection->Close();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("session", std::string("Failed to close data connection: ") + e.what());
        first_error = std::current_exception();
    }
    connection.reset();

    try {
        broker->ReleaseWorkspace(workspace);
    } catch (const std::exception& e) {
        LOG_ERROR("session", std::string("Failed to release workspace: ") + e.what());
        if (!first_error) {
            first_error = std::current_exception();
        }
    }

    try {
        workspace->Close();
    } catch (const std::exception& e) {
        LOG_ERROR("session", std::string("Failed to close workspace: ") + e.what());
        if (!first_error) {
            first_error = std::current_exception();
        }
    }
    workspace.reset();

    state = SessionState::CLOSED;
    if (first_error) {
        std::rethrow_exception(first_error);
    }
    LOG_INFO("session", "Workspace " + id + " closed");
}

void Session::Teardown() {
    if (connection) {
        try {
            if (connection->IsOpen()) {
                connection->Close();
            }
        } catch (const std::exception& e) {
            LOG_ERROR("session", std::string("Failed to close data connection: ") + e.what());
        }
        connection.reset();
    }
    if (workspace) {
        try {
            broker->ReleaseWorkspace(workspace);
        } catch (const std::exception& e) {
            LOG_ERROR("session", std::string("Failed to release workspace: ") + e.what());
        }
        try {
            workspace->Close();
        } catch (const std::exception& e) {
            LOG_ERROR("session", std::string("Failed to close workspace: ") + e.what());
        }
        workspace.reset();
    }
    workspace_id.clear();
}

broker::Workspace& Session::RequireWorkspace() {
    if (!workspace) {
        throw SessionStateError(std::string("Session is not open (state: ") +
                                SessionStateToString(state) + ")");
    }
    return *workspace;
}

broker::DataConnection& Session::RequireConnection() {
    RequireWorkspace();
    if (!connection || !connection->IsOpen()) {
        throw SessionStateError("Data connection is not open");
    }
    return *connection;
}

void Session::Submit(const std::string& code) {
    auto& language = RequireWorkspace().Language();
    ILOG_DEBUG("session", "Submitting {} bytes to workspace {}", code.size(), workspace_id);
    language.Submit(code);
}

std::string Session::FlushLog() {
    auto& language = RequireWorkspace().Language();
    std::string log = Drain([&language](size_t n) { return language.FlushLog(n); },
                            config.log_buffer);
    session_log += log;
    return log;
}

std::string Session::FlushListing() {
    auto& language = RequireWorkspace().Language();
    return Drain([&language](size_t n) { return language.FlushList(n); },
                 config.listing_buffer);
}

void Session::ResetParser() {
    RequireWorkspace().Language().Reset();
    if (state == SessionState::ERROR) {
        state = SessionState::OPEN;
    }
    LOG_TRACE("session", "Language service reset");
}

void Session::MarkError() {
    if (state == SessionState::OPEN) {
        state = SessionState::ERROR;
    }
}

std::string Session::ReadRemoteFile(const std::string& path) {
    auto& files = RequireWorkspace().Files();
    auto fileref = files.AssignFileref(READ_FILEREF, "DISK", path, "");
    FilerefScope fileref_scope(files, fileref->Name());

    // Binary streams carry text and images alike and impose no line length
    StreamScope stream(fileref->OpenBinaryStream(broker::StreamMode::READ));
    std::string bytes = DrainStream(*stream, config.file_buffer);
    stream.Close();

    ILOG_DEBUG("session", "Read {} bytes from {}", bytes.size(), path);
    return bytes;
}

void Session::WriteRemoteFile(const std::string& path, const std::string& bytes,
                              const std::string& options) {
    auto& files = RequireWorkspace().Files();
    auto fileref = files.AssignFileref(WRITE_FILEREF, "DISK", path, options);
    FilerefScope fileref_scope(files, fileref->Name());

    StreamScope stream(fileref->OpenBinaryStream(broker::StreamMode::WRITE));
    (*stream).Write(bytes);
    stream.Close();

    ILOG_DEBUG("session", "Wrote {} bytes to {}", bytes.size(), path);
}

std::unique_ptr<broker::RowCursor> Session::OpenColumnSchema(const std::string& table_path) {
    broker::SchemaCriteria criteria{std::nullopt, std::nullopt, table_path};
    return RequireConnection().OpenSchema(broker::SchemaKind::COLUMNS, criteria);
}

std::unique_ptr<broker::RowCursor> Session::OpenTableCursor(const std::string& table) {
    broker::CursorOptions options;
    options.cursor_type = broker::CursorType::FORWARD_ONLY;
    options.lock_type = broker::LockType::READ_ONLY;
    options.command_type = broker::CommandType::TABLE_DIRECT;
    options.max_open_rows = config.max_open_rows;
    options.page_size = config.page_size;
    options.cache_size = config.cache_size;
    return RequireConnection().OpenRecordset(table, options);
}

void Session::Execute(const std::string& statement) {
    ILOG_DEBUG("session", "Executing {} byte statement", statement.size());
    RequireConnection().Execute(statement);
}

} // namespace iomclient
