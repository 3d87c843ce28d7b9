//===----------------------------------------------------------------------===//
//                         IOM Client
//
// client/iom_client.hpp
//
// Local-facing API over one remote workspace session
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "broker/broker.hpp"
#include "config/session_config.hpp"
#include "data/csv_jobs.hpp"
#include "data/dataset_options.hpp"
#include "data/frame_writer.hpp"
#include "data/schema_resolver.hpp"
#include "data/table_marshaller.hpp"
#include "session/session.hpp"
#include "session/submission.hpp"
#include "transfer/file_transfer.hpp"

#include <arrow/api.h>

namespace iomclient {

using Overrides = std::vector<std::pair<std::string, std::string>>;

//===----------------------------------------------------------------------===//
// IomClient - owns the session for its whole lifetime
//
// The session is opened on construction and closed on destruction. All
// calls are blocking and must come from one thread at a time.
//===----------------------------------------------------------------------===//

class IomClient {
public:
    // Keyword overrides are filtered through the configuration's lock-down
    // policy before the session is opened. Throws ConnectionError.
    IomClient(std::shared_ptr<broker::ObjectBroker> broker, SessionConfig config,
              const Overrides& overrides = {}, std::shared_ptr<Prompter> prompter = nullptr);

    // Load `profile` from a YAML file, then construct as above
    static std::unique_ptr<IomClient> FromYaml(std::shared_ptr<broker::ObjectBroker> broker,
                                               const std::string& config_path,
                                               const std::string& profile = "",
                                               const Overrides& overrides = {},
                                               std::shared_ptr<Prompter> prompter = nullptr);

    ~IomClient();

    IomClient(const IomClient&) = delete;
    IomClient& operator=(const IomClient&) = delete;

    SubmitResult Submit(const std::string& code, ResultFormat format = ResultFormat::HTML,
                        const std::vector<MacroPrompt>& prompts = {});

    bool Exist(const std::string& table, const std::string& libref = "");

    // Cursor path
    arrow::Result<std::shared_ptr<arrow::Table>> Read(const std::string& table,
                                                      const std::string& libref = "",
                                                      const DatasetOptions& options = {});

    // CSV path
    arrow::Result<std::shared_ptr<arrow::Table>> ReadCsv(const std::string& table,
                                                         const std::string& libref = "",
                                                         const DatasetOptions& options = {},
                                                         const CsvReadOptions& csv_options = {});

    arrow::Status Write(const arrow::Table& frame, const std::string& table,
                        const std::string& libref = "");

    std::string ImportCsv(const std::string& filepath, const std::string& table,
                          const std::string& libref = "", const ImportOptions& options = {},
                          bool nosub = false);

    std::string ExportCsv(const std::string& table, const std::string& filepath,
                          const std::string& libref = "", const ExportOptions& options = {},
                          const DatasetOptions& dataset_options = {}, bool nosub = false);

    TransferResult Upload(const std::string& local_path, const std::string& remote_path,
                          bool overwrite = true, const std::string& permission = "");

    TransferResult Download(const std::string& local_path, const std::string& remote_path,
                            bool overwrite = true);

    const std::string& SessionLog() const;

    void Close();

    Session& GetSession() { return session; }
    SubmissionEngine& GetSubmitter() { return submitter; }
    const SessionConfig& GetConfig() const { return session.GetConfig(); }

private:
    static SessionConfig WithOverrides(SessionConfig config, const Overrides& overrides);

private:
    Session session;
    SubmissionEngine submitter;
    SchemaResolver resolver;
    TableMarshaller marshaller;
    FrameWriter writer;
    CsvJobs csv_jobs;
    RemoteFileInfo file_info;
    FileTransfer transfer;
};

} // namespace iomclient
