//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/table_marshaller.hpp
//
// Remote table -> local tabular data, via a row cursor or a CSV round trip
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "data/dataset_options.hpp"
#include "data/schema_resolver.hpp"
#include "data/value.hpp"

#include <arrow/api.h>

namespace iomclient {

struct CsvReadOptions {
    // Persist the raw downloaded CSV text to this local path when set
    std::string keep_copy_path;
};

class TableMarshaller {
public:
    TableMarshaller(Session& session_p, SubmissionEngine& submitter_p, SchemaResolver& resolver_p);

    // Cursor path. Materializes the table with `options` applied into a
    // staging table, then walks a forward-only read-only cursor over it,
    // converting every value through its column's conversion. Throws
    // std::runtime_error when the staging step logs an error.
    TabularResult ReadRows(const std::string& table, const std::string& libref = "",
                           const DatasetOptions& options = {});

    // Cursor path, converted to an Arrow table. Engine-side failures are
    // returned as IOError instead of thrown.
    arrow::Result<std::shared_ptr<arrow::Table>> Read(const std::string& table,
                                                      const std::string& libref = "",
                                                      const DatasetOptions& options = {});

    // CSV path. Stages the table with `options` applied like the cursor
    // path, exports it with date and datetime columns in ISO-8601 form and
    // lets the Arrow CSV reader type them as date32 / timestamp[us].
    arrow::Result<std::shared_ptr<arrow::Table>> ReadCsv(const std::string& table,
                                                         const std::string& libref = "",
                                                         const DatasetOptions& options = {},
                                                         const CsvReadOptions& csv_options = {});

    // Column types: date32 for date conversions, timestamp[us] for
    // datetime conversions, utf8 for character, float64 otherwise
    static std::shared_ptr<arrow::DataType> ArrowTypeFor(const ColumnMetadata& column);

    static arrow::Result<std::shared_ptr<arrow::Table>> ToArrowTable(const TabularResult& rows,
                                                                     const TableSchema& schema);

private:
    TableSchema Materialize(const std::string& table, const std::string& libref,
                            const DatasetOptions& options);

    // Walk the staging table with a forward-only read-only cursor
    TabularResult ReadStaged(const TableSchema& schema);

private:
    Session& session;
    SubmissionEngine& submitter;
    SchemaResolver& resolver;
};

} // namespace iomclient
