//===----------------------------------------------------------------------===//
//                         IOM Client
//
// transfer/file_transfer.hpp
//
// File upload and download through the workspace file service
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <string>

namespace iomclient {

// Outcome of an upload or download. Policy violations are reported here
// rather than thrown.
struct TransferResult {
    bool success = false;
    std::string message;
};

enum class RemotePathKind {
    MISSING,
    DIRECTORY,
    FILE
};

const char* RemotePathKindToString(RemotePathKind kind);

// Classifies paths on the engine host
class FileInfo {
public:
    virtual ~FileInfo() = default;
    virtual RemotePathKind Classify(const std::string& remote_path) = 0;
};

// Classifies a path by submitting a data step that probes it and reading
// the verdict back from the log
class RemoteFileInfo : public FileInfo {
public:
    static constexpr const char* MARKER = "IOMFILEINFO=";

    explicit RemoteFileInfo(SubmissionEngine& submitter_p);

    RemotePathKind Classify(const std::string& remote_path) override;

    static std::string ProbeProgram(const std::string& remote_path);
    static RemotePathKind ParseVerdict(const std::string& log);

private:
    SubmissionEngine& submitter;
};

class FileTransfer {
public:
    FileTransfer(Session& session_p, SubmissionEngine& submitter_p, FileInfo& file_info_p);

    // Copy a local file to the engine host. A remote directory target gets
    // the local file name appended. `permission` is passed through as the
    // fileref PERMISSION option when non-empty.
    TransferResult Upload(const std::string& local_path, const std::string& remote_path,
                          bool overwrite = true, const std::string& permission = "");

    // Copy a remote file to the local machine. A local directory target
    // gets the remote file name appended.
    TransferResult Download(const std::string& local_path, const std::string& remote_path,
                            bool overwrite = true);

private:
    Session& session;
    SubmissionEngine& submitter;
    FileInfo& file_info;
};

} // namespace iomclient
