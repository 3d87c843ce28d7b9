//===----------------------------------------------------------------------===//
//                         IOM Client
//
// transfer/file_transfer.cpp
//
// File transfer implementation
//===----------------------------------------------------------------------===//

#include "transfer/file_transfer.hpp"
#include "data/dataset_options.hpp"
#include "session/session.hpp"
#include "session/submission.hpp"
#include "logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace iomclient {

namespace fs = std::filesystem;

namespace {

TransferResult Failure(const std::string& message) {
    LOG_WARN("transfer", message);
    return TransferResult{false, message};
}

std::string TrimRight(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\r' || s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}

} // anonymous namespace

const char* RemotePathKindToString(RemotePathKind kind) {
    switch (kind) {
        case RemotePathKind::MISSING:   return "MISSING";
        case RemotePathKind::DIRECTORY: return "DIRECTORY";
        case RemotePathKind::FILE:      return "FILE";
    }
    return "UNKNOWN";
}

//===----------------------------------------------------------------------===//
// RemoteFileInfo
//===----------------------------------------------------------------------===//

RemoteFileInfo::RemoteFileInfo(SubmissionEngine& submitter_p)
    : submitter(submitter_p) {
}

std::string RemoteFileInfo::ProbeProgram(const std::string& remote_path) {
    std::ostringstream program;
    program << "data _null_;\n"
            << "    length fref $8;\n"
            << "    rc = filename(fref, " << QuoteString(remote_path) << ");\n"
            << "    if rc = 0 and fexist(fref) then do;\n"
            << "        did = dopen(fref);\n"
            << "        if did > 0 then do;\n"
            << "            put '" << MARKER << "DIRECTORY';\n"
            << "            rc = dclose(did);\n"
            << "        end;\n"
            << "        else put '" << MARKER << "FILE';\n"
            << "    end;\n"
            << "    else put '" << MARKER << "MISSING';\n"
            << "    rc = filename(fref);\n"
            << "run;\n";
    return program.str();
}

RemotePathKind RemoteFileInfo::ParseVerdict(const std::string& log) {
    const std::string marker = MARKER;
    std::istringstream lines(log);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, marker.size(), marker) != 0) {
            continue;
        }
        std::string verdict = TrimRight(line.substr(marker.size()));
        if (verdict == "DIRECTORY") {
            return RemotePathKind::DIRECTORY;
        }
        if (verdict == "FILE") {
            return RemotePathKind::FILE;
        }
        return RemotePathKind::MISSING;
    }
    return RemotePathKind::MISSING;
}

RemotePathKind RemoteFileInfo::Classify(const std::string& remote_path) {
    auto result = submitter.Submit(ProbeProgram(remote_path), ResultFormat::TEXT);
    RemotePathKind kind = ParseVerdict(result.log);
    ILOG_TRACE("transfer", "{} classified as {}", remote_path, RemotePathKindToString(kind));
    return kind;
}

//===----------------------------------------------------------------------===//
// FileTransfer
//===----------------------------------------------------------------------===//

FileTransfer::FileTransfer(Session& session_p, SubmissionEngine& submitter_p, FileInfo& file_info_p)
    : session(session_p)
    , submitter(submitter_p)
    , file_info(file_info_p) {
}

TransferResult FileTransfer::Upload(const std::string& local_path, const std::string& remote_path,
                                    bool overwrite, const std::string& permission) {
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return Failure("Local file " + local_path + " could not be opened. Upload was stopped.");
    }
    std::ostringstream content;
    content << in.rdbuf();

    std::string target = remote_path;
    switch (file_info.Classify(remote_path)) {
        case RemotePathKind::DIRECTORY: {
            std::string base = fs::path(local_path).filename().string();
            if (target.empty() || target.back() != submitter.HostSeparator()) {
                target += submitter.HostSeparator();
            }
            target += base;
            break;
        }
        case RemotePathKind::FILE:
            if (!overwrite) {
                return Failure("File " + remote_path +
                               " exists and overwrite was set to False. Upload was stopped.");
            }
            break;
        case RemotePathKind::MISSING:
            break;
    }

    std::string options = permission.empty() ? "" : "PERMISSION='" + permission + "'";
    session.WriteRemoteFile(target, content.str(), options);

    ILOG_INFO("transfer", "Uploaded {} to {}", local_path, target);
    return TransferResult{true, "File successfully written using FileService."};
}

TransferResult FileTransfer::Download(const std::string& local_path, const std::string& remote_path,
                                      bool overwrite) {
    switch (file_info.Classify(remote_path)) {
        case RemotePathKind::MISSING:
            return Failure("File " + remote_path + " does not exist.");
        case RemotePathKind::DIRECTORY:
            return Failure("File " + remote_path + " is a directory.");
        case RemotePathKind::FILE:
            break;
    }

    fs::path target(local_path);
    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        char sep = submitter.HostSeparator();
        auto pos = remote_path.rfind(sep);
        target /= pos == std::string::npos ? remote_path : remote_path.substr(pos + 1);
    }
    if (!overwrite && fs::exists(target, ec)) {
        return Failure("File " + target.string() +
                       " exists and overwrite was set to False. Download was stopped.");
    }

    std::string bytes = session.ReadRemoteFile(remote_path);

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Failure("Local file " + target.string() + " could not be written.");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return Failure("Local file " + target.string() + " could not be written.");
    }

    ILOG_INFO("transfer", "Downloaded {} to {}", remote_path, target.string());
    return TransferResult{true, "File successfully read using FileService."};
}

} // namespace iomclient
