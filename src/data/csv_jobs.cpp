//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/csv_jobs.cpp
//
// CSV import and export jobs
//===----------------------------------------------------------------------===//

#include "data/csv_jobs.hpp"
#include "session/submission.hpp"
#include "logging/logger.hpp"

#include <algorithm>
#include <cctype>

namespace iomclient {

namespace {

constexpr const char* CSV_FILEREF = "csv_file";

bool IsUrl(const std::string& filepath) {
    std::string prefix = filepath.substr(0, 4);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return prefix == "http";
}

// The filename statement takes the URL access method ahead of the quoted
// location
std::string FilenameStatement(const std::string& filepath) {
    std::string statement = std::string("filename ") + CSV_FILEREF + " ";
    if (IsUrl(filepath)) {
        statement += "url ";
    }
    return statement + QuoteString(filepath) + ";\n";
}

} // anonymous namespace

CsvJobs::CsvJobs(SubmissionEngine& submitter_p)
    : submitter(submitter_p) {
}

std::string CsvJobs::ImportProgram(const std::string& filepath, const std::string& table,
                                   const std::string& libref, const ImportOptions& options) {
    std::string program = FilenameStatement(filepath);
    program += std::string("proc import datafile=") + CSV_FILEREF + " out=" + TablePath(table, libref) +
               " dbms=csv replace;\n";
    std::string rendered = options.Render();
    if (!rendered.empty()) {
        program += rendered + "\n";
    }
    program += "run;\n";
    return program;
}

std::string CsvJobs::ExportProgram(const std::string& filepath, const std::string& table,
                                   const std::string& libref, const ExportOptions& options,
                                   const DatasetOptions& dataset_options) {
    DatasetOptions filters = dataset_options;
    filters.formats.clear();

    std::string source = TablePath(table, libref);
    std::string rendered_filters = filters.Render();
    if (!rendered_filters.empty()) {
        source += " " + rendered_filters;
    }

    std::string program = FilenameStatement(filepath);
    program += "proc export data=" + source + " outfile=" + CSV_FILEREF + " dbms=csv replace;\n";
    std::string rendered = options.Render();
    if (!rendered.empty()) {
        program += rendered + "\n";
    }
    program += "run;\n";
    return program;
}

std::string CsvJobs::Import(const std::string& filepath, const std::string& table,
                            const std::string& libref, const ImportOptions& options, bool nosub) {
    std::string program = ImportProgram(filepath, table, libref, options);
    if (nosub) {
        return program;
    }
    ILOG_DEBUG("csv", "Importing {} into {}", filepath, TablePath(table, libref));
    return submitter.Submit(program, ResultFormat::TEXT).log;
}

std::string CsvJobs::Export(const std::string& filepath, const std::string& table,
                            const std::string& libref, const ExportOptions& options,
                            const DatasetOptions& dataset_options, bool nosub) {
    std::string program = ExportProgram(filepath, table, libref, options, dataset_options);
    if (nosub) {
        return program;
    }
    ILOG_DEBUG("csv", "Exporting {} to {}", TablePath(table, libref), filepath);
    return submitter.Submit(program, ResultFormat::TEXT).log;
}

} // namespace iomclient
