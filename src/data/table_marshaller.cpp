//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/table_marshaller.cpp
//
// Table marshaller implementation
//===----------------------------------------------------------------------===//

#include "data/table_marshaller.hpp"
#include "session/session.hpp"
#include "session/submission.hpp"
#include "logging/logger.hpp"

#include <arrow/csv/api.h>
#include <arrow/io/memory.h>

#include <fstream>
#include <sstream>

namespace iomclient {

namespace {

// Fixed formats the CSV path forces onto calendar columns
constexpr const char* DATE_FORMAT_NAME = "E8601DA";
constexpr int32_t DATE_FORMAT_LENGTH = 10;
constexpr int32_t DATE_FORMAT_PRECISION = 0;
constexpr const char* DATETIME_FORMAT_NAME = "E8601DT";
constexpr int32_t DATETIME_FORMAT_LENGTH = 26;
constexpr int32_t DATETIME_FORMAT_PRECISION = 6;

std::string FirstErrorLine(const std::string& log) {
    std::istringstream lines(log);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, 5, "ERROR") == 0) {
            return line;
        }
    }
    return "";
}

std::string ColumnRef(const std::string& name) {
    return IsPlainName(name) ? name : NameLiteral(name);
}

arrow::Status AppendValue(arrow::ArrayBuilder& builder, const Value& value) {
    if (IsMissing(value)) {
        return builder.AppendNull();
    }
    switch (builder.type()->id()) {
        case arrow::Type::DOUBLE:
            if (auto d = std::get_if<double>(&value)) {
                return static_cast<arrow::DoubleBuilder&>(builder).Append(*d);
            }
            break;
        case arrow::Type::STRING:
            if (auto s = std::get_if<std::string>(&value)) {
                return static_cast<arrow::StringBuilder&>(builder).Append(*s);
            }
            break;
        case arrow::Type::DATE32:
            if (auto d = std::get_if<Date>(&value)) {
                return static_cast<arrow::Date32Builder&>(builder).Append(d->days);
            }
            break;
        case arrow::Type::TIMESTAMP:
            if (auto dt = std::get_if<DateTime>(&value)) {
                return static_cast<arrow::TimestampBuilder&>(builder).Append(dt->micros);
            }
            break;
        default:
            break;
    }
    return arrow::Status::TypeError("Value does not match column type ", builder.type()->ToString());
}

// Infer a column type from the first non-missing value when the schema
// has no entry for the column
std::shared_ptr<arrow::DataType> InferType(const TabularResult& rows, size_t col) {
    for (const auto& row : rows.rows) {
        const Value& v = row[col];
        if (std::holds_alternative<std::string>(v)) return arrow::utf8();
        if (std::holds_alternative<Date>(v)) return arrow::date32();
        if (std::holds_alternative<DateTime>(v)) return arrow::timestamp(arrow::TimeUnit::MICRO);
        if (std::holds_alternative<double>(v)) return arrow::float64();
    }
    return arrow::float64();
}

std::string FormatRef(const std::string& name, int32_t length, int32_t precision) {
    if (length <= 0) {
        return name + ".";
    }
    return name + std::to_string(length) + "." + std::to_string(precision);
}

} // anonymous namespace

TableMarshaller::TableMarshaller(Session& session_p, SubmissionEngine& submitter_p,
                                 SchemaResolver& resolver_p)
    : session(session_p)
    , submitter(submitter_p)
    , resolver(resolver_p) {
}

TableSchema TableMarshaller::Materialize(const std::string& table, const std::string& libref,
                                         const DatasetOptions& options) {
    std::ostringstream program;
    program << "data " << STAGING_TABLE << ";\n"
            << "    set " << TablePath(table, libref) << " " << options.Render() << ";\n"
            << "run;\n";

    auto result = submitter.Submit(program.str(), ResultFormat::TEXT);
    std::string error = FirstErrorLine(result.log);
    if (!error.empty()) {
        throw std::runtime_error("Failed to materialize " + TablePath(table, libref) + ": " + error);
    }
    return resolver.Resolve(STAGING_TABLE);
}

TabularResult TableMarshaller::ReadStaged(const TableSchema& schema) {
    auto cursor = session.OpenTableCursor(STAGING_TABLE);

    TabularResult result;
    result.header = cursor->FieldNames();

    // Resolve conversions once per column, not per cell
    std::vector<ColumnConversion> conversions;
    conversions.reserve(result.header.size());
    for (const auto& name : result.header) {
        const ColumnMetadata* column = schema.Find(name);
        conversions.push_back(column ? column->conversion : ColumnConversion{});
    }

    if (!cursor->IsEof()) {
        cursor->MoveFirst();
    }
    while (!cursor->IsEof()) {
        auto fields = cursor->Fields();
        if (fields.size() != conversions.size()) {
            throw std::runtime_error("Cursor row has " + std::to_string(fields.size()) +
                                     " fields, expected " + std::to_string(conversions.size()));
        }
        std::vector<Value> row;
        row.reserve(fields.size());
        for (size_t i = 0; i < fields.size(); ++i) {
            row.push_back(conversions[i].Apply(fields[i].value));
        }
        result.rows.push_back(std::move(row));
        cursor->MoveNext();
    }
    cursor->Close();
    return result;
}

TabularResult TableMarshaller::ReadRows(const std::string& table, const std::string& libref,
                                        const DatasetOptions& options) {
    TabularResult result = ReadStaged(Materialize(table, libref, options));
    ILOG_DEBUG("marshal", "Read {} rows x {} columns from {}", result.rows.size(),
               result.header.size(), TablePath(table, libref));
    return result;
}

arrow::Result<std::shared_ptr<arrow::Table>> TableMarshaller::Read(const std::string& table,
                                                                   const std::string& libref,
                                                                   const DatasetOptions& options) {
    TableSchema schema;
    TabularResult rows;
    try {
        schema = Materialize(table, libref, options);
        rows = ReadStaged(schema);
    } catch (const SessionStateError&) {
        throw;
    } catch (const PromptCancelled&) {
        throw;
    } catch (const std::runtime_error& e) {
        return arrow::Status::IOError(e.what());
    }
    ILOG_DEBUG("marshal", "Read {} rows x {} columns from {}", rows.rows.size(),
               rows.header.size(), TablePath(table, libref));
    return ToArrowTable(rows, schema);
}

std::shared_ptr<arrow::DataType> TableMarshaller::ArrowTypeFor(const ColumnMetadata& column) {
    switch (column.conversion.kind) {
        case ConversionKind::DAYS_SINCE_EPOCH:
            return arrow::date32();
        case ConversionKind::SECONDS_SINCE_EPOCH:
            return arrow::timestamp(arrow::TimeUnit::MICRO);
        case ConversionKind::IDENTITY:
        default:
            return column.is_character ? arrow::utf8() : arrow::float64();
    }
}

arrow::Result<std::shared_ptr<arrow::Table>> TableMarshaller::ToArrowTable(const TabularResult& rows,
                                                                           const TableSchema& schema) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    for (size_t col = 0; col < rows.header.size(); ++col) {
        const std::string& name = rows.header[col];
        const ColumnMetadata* column = schema.Find(name);
        auto type = column ? ArrowTypeFor(*column) : InferType(rows, col);

        std::unique_ptr<arrow::ArrayBuilder> builder;
        ARROW_RETURN_NOT_OK(arrow::MakeBuilder(arrow::default_memory_pool(), type, &builder));
        ARROW_RETURN_NOT_OK(builder->Reserve(static_cast<int64_t>(rows.rows.size())));

        for (const auto& row : rows.rows) {
            if (row.size() != rows.header.size()) {
                return arrow::Status::Invalid("Row width ", row.size(), " does not match header width ",
                                              rows.header.size());
            }
            ARROW_RETURN_NOT_OK(AppendValue(*builder, row[col]));
        }

        std::shared_ptr<arrow::Array> array;
        ARROW_RETURN_NOT_OK(builder->Finish(&array));
        fields.push_back(arrow::field(name, type));
        arrays.push_back(std::move(array));
    }

    return arrow::Table::Make(arrow::schema(fields), arrays,
                              static_cast<int64_t>(rows.rows.size()));
}

arrow::Result<std::shared_ptr<arrow::Table>> TableMarshaller::ReadCsv(const std::string& table,
                                                                      const std::string& libref,
                                                                      const DatasetOptions& options,
                                                                      const CsvReadOptions& csv_options) {
    const std::string csv_path = submitter.WorkPath() + STAGING_CSV_FILE;
    const std::string path = TablePath(table, libref);
    if (resolver.Resolve(table, libref).Empty()) {
        return arrow::Status::KeyError("Table ", path, " does not exist or has no columns");
    }

    // Options, caller formats included, apply before the export formats so
    // the staged schema decides which columns are calendar columns
    TableSchema schema;
    try {
        schema = Materialize(table, libref, options);
    } catch (const SessionStateError&) {
        throw;
    } catch (const PromptCancelled&) {
        throw;
    } catch (const std::runtime_error& e) {
        return arrow::Status::IOError(e.what());
    }

    // Force calendar columns into ISO-8601 so the CSV reader can type them
    std::vector<std::string> formats;
    for (const auto& column : schema.Columns()) {
        switch (column.conversion.kind) {
            case ConversionKind::DAYS_SINCE_EPOCH:
                formats.push_back(ColumnRef(column.name) + " " +
                                  FormatRef(DATE_FORMAT_NAME, DATE_FORMAT_LENGTH, DATE_FORMAT_PRECISION));
                break;
            case ConversionKind::SECONDS_SINCE_EPOCH:
                formats.push_back(ColumnRef(column.name) + " " +
                                  FormatRef(DATETIME_FORMAT_NAME, DATETIME_FORMAT_LENGTH,
                                            DATETIME_FORMAT_PRECISION));
                break;
            case ConversionKind::IDENTITY:
            default:
                if (!column.format_name.empty()) {
                    formats.push_back(ColumnRef(column.name) + " " +
                                      FormatRef(column.format_name, column.format_length,
                                                column.format_decimal));
                }
                break;
        }
    }

    std::ostringstream program;
    if (!formats.empty()) {
        program << "data " << STAGING_TABLE << ";\n"
                << "    format";
        for (const auto& f : formats) {
            program << " " << f;
        }
        program << ";\n"
                << "    set " << STAGING_TABLE << ";\n"
                << "run;\n\n";
    }
    program << "proc export data=" << STAGING_TABLE << "\n"
            << "        outfile=" << QuoteString(csv_path) << "\n"
            << "        dbms=csv replace;\n"
            << "run;\n";

    auto submitted = submitter.Submit(program.str(), ResultFormat::TEXT);
    std::string error = FirstErrorLine(submitted.log);
    if (!error.empty()) {
        return arrow::Status::IOError("CSV export of ", path, " failed: ", error);
    }

    std::string text = session.ReadRemoteFile(csv_path);

    if (!csv_options.keep_copy_path.empty()) {
        std::ofstream out(csv_options.keep_copy_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return arrow::Status::IOError("Cannot write ", csv_options.keep_copy_path);
        }
        out << text;
    }

    // ISO-8601 text parses straight into date32 / timestamp[us]; empty
    // cells become nulls
    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    for (const auto& column : schema.Columns()) {
        convert_options.column_types[column.name] = ArrowTypeFor(column);
    }

    auto input = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(std::move(text)));
    ARROW_ASSIGN_OR_RAISE(auto reader,
        arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                      read_options, parse_options, convert_options));
    ARROW_ASSIGN_OR_RAISE(auto result, reader->Read());

    ILOG_DEBUG("marshal", "Read {} rows x {} columns from {} via CSV", result->num_rows(),
               result->num_columns(), path);
    return result;
}

} // namespace iomclient
