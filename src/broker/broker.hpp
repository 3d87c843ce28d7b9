//===----------------------------------------------------------------------===//
//                         IOM Client
//
// broker/broker.hpp
//
// Object-broker boundary. The transport behind these interfaces is opaque;
// the client only drives workspaces, language and file services, binary
// streams, and the tabular data connection through them.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace iomclient {
namespace broker {

enum class Protocol : int32_t {
    COM = 0,
    IOM = 2
};

// Where and how to reach the engine
struct ServerDef {
    std::string machine_dns_name;
    uint16_t port = 0;
    Protocol protocol = Protocol::COM;
    std::string class_identifier;
};

enum class StreamMode : int32_t {
    READ = 1,
    WRITE = 2
};

class BinaryStream {
public:
    virtual ~BinaryStream() = default;

    // Read at most `max_bytes`; an empty result means end of stream
    virtual std::string Read(size_t max_bytes) = 0;
    virtual void Write(const std::string& bytes) = 0;
    virtual void Close() = 0;
};

class Fileref {
public:
    virtual ~Fileref() = default;

    virtual const std::string& Name() const = 0;
    virtual std::unique_ptr<BinaryStream> OpenBinaryStream(StreamMode mode) = 0;
};

class FileService {
public:
    virtual ~FileService() = default;

    virtual std::shared_ptr<Fileref> AssignFileref(const std::string& name,
                                                   const std::string& device_type,
                                                   const std::string& path,
                                                   const std::string& options) = 0;
    virtual void DeassignFileref(const std::string& name) = 0;
};

class LanguageService {
public:
    virtual ~LanguageService() = default;

    virtual void Submit(const std::string& code) = 0;
    virtual std::string FlushLog(size_t max_bytes) = 0;
    virtual std::string FlushList(size_t max_bytes) = 0;

    // Return the token scanner to its initial state
    virtual void Reset() = 0;
};

class Workspace {
public:
    virtual ~Workspace() = default;

    virtual std::string UniqueIdentifier() const = 0;
    virtual LanguageService& Language() = 0;
    virtual FileService& Files() = 0;
    virtual void Close() = 0;
};

//===----------------------------------------------------------------------===//
// Tabular data access
//===----------------------------------------------------------------------===//

// Engine cell: missing, numeric, or character
using RemoteValue = std::variant<std::monostate, double, std::string>;

struct Field {
    std::string name;
    RemoteValue value;
};

enum class CursorType : int32_t {
    UNSPECIFIED = -1,
    FORWARD_ONLY = 0,
    KEYSET = 1,
    DYNAMIC = 2,
    STATIC = 3
};

enum class LockType : int32_t {
    UNSPECIFIED = -1,
    READ_ONLY = 1,
    PESSIMISTIC = 2,
    OPTIMISTIC = 3,
    BATCH_OPTIMISTIC = 4
};

enum class CommandType : int32_t {
    UNSPECIFIED = -1,
    TEXT = 1,
    TABLE = 2,
    STORED_PROC = 4,
    UNKNOWN = 8,
    FILE = 256,
    TABLE_DIRECT = 512
};

enum class SchemaKind : int32_t {
    COLUMNS = 4,
    TABLES = 20
};

struct CursorOptions {
    CursorType cursor_type = CursorType::FORWARD_ONLY;
    LockType lock_type = LockType::READ_ONLY;
    CommandType command_type = CommandType::TABLE_DIRECT;
    int32_t max_open_rows = DEFAULT_MAX_OPEN_ROWS;   // server-side row cache
    int32_t page_size = DEFAULT_PAGE_SIZE;           // download buffer, rows
    int32_t cache_size = DEFAULT_CACHE_SIZE;         // client-side record cache
};

class RowCursor {
public:
    virtual ~RowCursor() = default;

    virtual bool IsBof() const = 0;
    virtual bool IsEof() const = 0;
    virtual void MoveFirst() = 0;
    virtual void MoveNext() = 0;

    // Fields of the current row, in column order
    virtual std::vector<Field> Fields() const = 0;
    virtual std::vector<std::string> FieldNames() const = 0;

    virtual void Close() = 0;
};

// Schema restriction; unset entries match anything
using SchemaCriteria = std::vector<std::optional<std::string>>;

class DataConnection {
public:
    virtual ~DataConnection() = default;

    virtual void Open(const std::string& connection_string) = 0;
    virtual bool IsOpen() const = 0;
    virtual void Close() = 0;

    virtual std::unique_ptr<RowCursor> OpenSchema(SchemaKind kind, const SchemaCriteria& criteria) = 0;
    virtual std::unique_ptr<RowCursor> OpenRecordset(const std::string& source, const CursorOptions& options) = 0;
    virtual void Execute(const std::string& statement) = 0;
};

//===----------------------------------------------------------------------===//
// Broker entry point
//===----------------------------------------------------------------------===//

class ObjectBroker {
public:
    virtual ~ObjectBroker() = default;

    virtual std::shared_ptr<Workspace> CreateWorkspace(const std::string& logical_name,
                                                       const ServerDef& server,
                                                       const std::optional<std::string>& user,
                                                       const std::optional<std::string>& password) = 0;

    // Registry that keeps workspaces reachable by the data provider
    virtual void KeepWorkspace(int32_t id, const std::string& name,
                               const std::shared_ptr<Workspace>& workspace) = 0;
    virtual void ReleaseWorkspace(const std::shared_ptr<Workspace>& workspace) = 0;

    virtual std::unique_ptr<DataConnection> NewDataConnection() = 0;
};

} // namespace broker
} // namespace iomclient
