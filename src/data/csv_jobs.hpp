//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/csv_jobs.hpp
//
// Remote-side CSV import and export jobs
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "data/dataset_options.hpp"

namespace iomclient {

class CsvJobs {
public:
    explicit CsvJobs(SubmissionEngine& submitter_p);

    // `filepath` is a path on the engine host, or an http(s) URL
    static std::string ImportProgram(const std::string& filepath, const std::string& table,
                                     const std::string& libref = "",
                                     const ImportOptions& options = {});

    // Formats in `dataset_options` are not applied to exports
    static std::string ExportProgram(const std::string& filepath, const std::string& table,
                                     const std::string& libref = "",
                                     const ExportOptions& options = {},
                                     const DatasetOptions& dataset_options = {});

    // Load a CSV file into `table`. With `nosub` the program text is
    // returned unsubmitted, otherwise the submission log.
    std::string Import(const std::string& filepath, const std::string& table,
                       const std::string& libref = "", const ImportOptions& options = {},
                       bool nosub = false);

    // Write `table` to a CSV file. Same return convention as Import().
    std::string Export(const std::string& filepath, const std::string& table,
                       const std::string& libref = "", const ExportOptions& options = {},
                       const DatasetOptions& dataset_options = {}, bool nosub = false);

private:
    SubmissionEngine& submitter;
};

} // namespace iomclient
