//===----------------------------------------------------------------------===//
//                         IOM Client
//
// client/iom_client.cpp
//
// Client facade implementation
//===----------------------------------------------------------------------===//

#include "client/iom_client.hpp"
#include "logging/logger.hpp"

namespace iomclient {

SessionConfig IomClient::WithOverrides(SessionConfig config, const Overrides& overrides) {
    size_t honored = config.ApplyOverrides(overrides);
    if (!overrides.empty()) {
        ILOG_DEBUG("client", "{} of {} overrides honored", honored, overrides.size());
    }
    return config;
}

IomClient::IomClient(std::shared_ptr<broker::ObjectBroker> broker, SessionConfig config,
                     const Overrides& overrides, std::shared_ptr<Prompter> prompter)
    : session(std::move(broker), WithOverrides(std::move(config), overrides))
    , submitter(session, std::move(prompter))
    , resolver(session)
    , marshaller(session, submitter, resolver)
    , writer(session)
    , csv_jobs(submitter)
    , file_info(submitter)
    , transfer(session, submitter, file_info) {
    session.Open();
}

std::unique_ptr<IomClient> IomClient::FromYaml(std::shared_ptr<broker::ObjectBroker> broker,
                                               const std::string& config_path,
                                               const std::string& profile,
                                               const Overrides& overrides,
                                               std::shared_ptr<Prompter> prompter) {
    SessionConfig config;
    std::string error;
    if (!config.LoadFromYaml(config_path, profile, error)) {
        throw ConnectionError("Failed to load configuration from " + config_path + ": " + error);
    }
    return std::make_unique<IomClient>(std::move(broker), std::move(config), overrides,
                                       std::move(prompter));
}

IomClient::~IomClient() = default;

SubmitResult IomClient::Submit(const std::string& code, ResultFormat format,
                               const std::vector<MacroPrompt>& prompts) {
    return submitter.Submit(code, format, prompts);
}

bool IomClient::Exist(const std::string& table, const std::string& libref) {
    return resolver.Exists(table, libref);
}

arrow::Result<std::shared_ptr<arrow::Table>> IomClient::Read(const std::string& table,
                                                             const std::string& libref,
                                                             const DatasetOptions& options) {
    return marshaller.Read(table, libref, options);
}

arrow::Result<std::shared_ptr<arrow::Table>> IomClient::ReadCsv(const std::string& table,
                                                                const std::string& libref,
                                                                const DatasetOptions& options,
                                                                const CsvReadOptions& csv_options) {
    return marshaller.ReadCsv(table, libref, options, csv_options);
}

arrow::Status IomClient::Write(const arrow::Table& frame, const std::string& table,
                               const std::string& libref) {
    return writer.Write(frame, table, libref);
}

std::string IomClient::ImportCsv(const std::string& filepath, const std::string& table,
                                 const std::string& libref, const ImportOptions& options,
                                 bool nosub) {
    return csv_jobs.Import(filepath, table, libref, options, nosub);
}

std::string IomClient::ExportCsv(const std::string& table, const std::string& filepath,
                                 const std::string& libref, const ExportOptions& options,
                                 const DatasetOptions& dataset_options, bool nosub) {
    return csv_jobs.Export(filepath, table, libref, options, dataset_options, nosub);
}

TransferResult IomClient::Upload(const std::string& local_path, const std::string& remote_path,
                                 bool overwrite, const std::string& permission) {
    return transfer.Upload(local_path, remote_path, overwrite, permission);
}

TransferResult IomClient::Download(const std::string& local_path, const std::string& remote_path,
                                   bool overwrite) {
    return transfer.Download(local_path, remote_path, overwrite);
}

const std::string& IomClient::SessionLog() const {
    return session.GetSessionLog();
}

void IomClient::Close() {
    session.Close();
}

} // namespace iomclient
