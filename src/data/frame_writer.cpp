//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/frame_writer.cpp
//
// Frame writer implementation
//===----------------------------------------------------------------------===//

#include "data/frame_writer.hpp"
#include "data/dataset_options.hpp"
#include "data/value.hpp"
#include "session/session.hpp"
#include "logging/logger.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace iomclient {

namespace {

constexpr const char* DATETIME_FORMAT = "E8601DT26.6";
constexpr int64_t MICROS_PER_DAY = 86400LL * 1000000LL;

template <typename ArrayType>
double NumberAt(const arrow::Array& column, int64_t row) {
    return static_cast<double>(static_cast<const ArrayType&>(column).Value(row));
}

bool IsNumericType(arrow::Type::type id) {
    switch (id) {
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
        case arrow::Type::INT64:
        case arrow::Type::UINT8:
        case arrow::Type::UINT16:
        case arrow::Type::UINT32:
        case arrow::Type::UINT64:
        case arrow::Type::FLOAT:
        case arrow::Type::DOUBLE:
            return true;
        default:
            return false;
    }
}

bool IsDateTimeType(arrow::Type::type id) {
    return id == arrow::Type::TIMESTAMP || id == arrow::Type::DATE32 || id == arrow::Type::DATE64;
}

bool IsStringType(arrow::Type::type id) {
    return id == arrow::Type::STRING || id == arrow::Type::LARGE_STRING;
}

arrow::Result<double> NumericValue(const arrow::Array& column, int64_t row) {
    switch (column.type_id()) {
        case arrow::Type::INT8:   return NumberAt<arrow::Int8Array>(column, row);
        case arrow::Type::INT16:  return NumberAt<arrow::Int16Array>(column, row);
        case arrow::Type::INT32:  return NumberAt<arrow::Int32Array>(column, row);
        case arrow::Type::INT64:  return NumberAt<arrow::Int64Array>(column, row);
        case arrow::Type::UINT8:  return NumberAt<arrow::UInt8Array>(column, row);
        case arrow::Type::UINT16: return NumberAt<arrow::UInt16Array>(column, row);
        case arrow::Type::UINT32: return NumberAt<arrow::UInt32Array>(column, row);
        case arrow::Type::UINT64: return NumberAt<arrow::UInt64Array>(column, row);
        case arrow::Type::FLOAT:  return NumberAt<arrow::FloatArray>(column, row);
        case arrow::Type::DOUBLE: return NumberAt<arrow::DoubleArray>(column, row);
        default:
            return arrow::Status::TypeError("Column of type ", column.type()->ToString(),
                                            " is not numeric");
    }
}

// Floor division so instants before 1970 keep their sub-unit part positive
int64_t FloorDiv(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

arrow::Result<int64_t> MicrosValue(const arrow::Array& column, int64_t row) {
    switch (column.type_id()) {
        case arrow::Type::DATE32:
            return static_cast<int64_t>(static_cast<const arrow::Date32Array&>(column).Value(row)) *
                   MICROS_PER_DAY;
        case arrow::Type::DATE64:
            return static_cast<const arrow::Date64Array&>(column).Value(row) * 1000;
        case arrow::Type::TIMESTAMP: {
            int64_t raw = static_cast<const arrow::TimestampArray&>(column).Value(row);
            const auto& type = static_cast<const arrow::TimestampType&>(*column.type());
            switch (type.unit()) {
                case arrow::TimeUnit::SECOND: return raw * 1000000;
                case arrow::TimeUnit::MILLI:  return raw * 1000;
                case arrow::TimeUnit::MICRO:  return raw;
                case arrow::TimeUnit::NANO:   return FloorDiv(raw, 1000);
            }
            break;
        }
        default:
            break;
    }
    return arrow::Status::TypeError("Column of type ", column.type()->ToString(),
                                    " is not a date or timestamp");
}

arrow::Result<std::string> TextValue(const arrow::Array& column, int64_t row) {
    switch (column.type_id()) {
        case arrow::Type::STRING:
            return static_cast<const arrow::StringArray&>(column).GetString(row);
        case arrow::Type::LARGE_STRING:
            return static_cast<const arrow::LargeStringArray&>(column).GetString(row);
        default: {
            ARROW_ASSIGN_OR_RAISE(auto scalar, column.GetScalar(row));
            return scalar->ToString();
        }
    }
}

std::string QuoteLiteral(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        out += c;
        if (c == '\'') {
            out += '\'';
        }
    }
    out += "'";
    return out;
}

arrow::Result<int32_t> LongestValue(const arrow::Array& column) {
    size_t longest = 1;
    for (int64_t row = 0; row < column.length(); ++row) {
        if (column.IsNull(row)) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(auto text, TextValue(column, row));
        longest = std::max(longest, text.size());
    }
    return static_cast<int32_t>(longest);
}

std::string FormatNumber(double value) {
    std::ostringstream out;
    out << std::setprecision(17) << value;
    return out.str();
}

} // anonymous namespace

FrameWriter::FrameWriter(Session& session_p)
    : session(session_p) {
}

arrow::Result<ColumnCodec> FrameWriter::ResolveCodec(const arrow::Array& column) {
    auto id = column.type_id();
    if (IsNumericType(id)) {
        return ColumnCodec{codec::Numeric{}};
    }
    if (IsDateTimeType(id)) {
        return ColumnCodec{codec::DateTime{}};
    }
    ARROW_ASSIGN_OR_RAISE(int32_t length, LongestValue(column));
    if (IsStringType(id)) {
        return ColumnCodec{codec::String{length}};
    }
    return ColumnCodec{codec::Fallback{length}};
}

std::string FrameWriter::ColumnDefinition(const std::string& name, const ColumnCodec& codec) {
    std::string def = NameLiteral(name);
    if (std::holds_alternative<codec::Numeric>(codec)) {
        return def + " num";
    }
    if (std::holds_alternative<codec::DateTime>(codec)) {
        return def + " num informat=" + DATETIME_FORMAT + " format=" + DATETIME_FORMAT;
    }
    if (auto s = std::get_if<codec::String>(&codec)) {
        return def + " char(" + std::to_string(s->length) + ")";
    }
    return def + " char(" + std::to_string(std::get<codec::Fallback>(codec).length) + ")";
}

arrow::Result<std::string> FrameWriter::RenderLiteral(const ColumnCodec& codec,
                                                      const arrow::Array& column, int64_t row) {
    if (column.IsNull(row)) {
        return std::string("NULL");
    }
    if (std::holds_alternative<codec::Numeric>(codec)) {
        ARROW_ASSIGN_OR_RAISE(double value, NumericValue(column, row));
        if (!std::isfinite(value)) {
            return std::string("NULL");
        }
        return FormatNumber(value);
    }
    if (std::holds_alternative<codec::DateTime>(codec)) {
        ARROW_ASSIGN_OR_RAISE(int64_t micros, MicrosValue(column, row));
        return QuoteLiteral(calendar::FormatDateTime(DateTime{micros})) + "DT";
    }
    ARROW_ASSIGN_OR_RAISE(auto text, TextValue(column, row));
    return QuoteLiteral(text);
}

arrow::Result<std::vector<std::string>> FrameWriter::BuildStatements(const arrow::Table& frame,
                                                                     const std::string& path) {
    if (frame.num_columns() == 0) {
        return arrow::Status::Invalid("Cannot write a frame with no columns to ", path);
    }
    ARROW_ASSIGN_OR_RAISE(auto combined, frame.CombineChunks());

    std::vector<std::shared_ptr<arrow::Array>> columns;
    std::vector<ColumnCodec> codecs;
    std::vector<std::string> definitions;
    for (int i = 0; i < combined->num_columns(); ++i) {
        auto chunked = combined->column(i);
        std::shared_ptr<arrow::Array> column;
        if (chunked->num_chunks() == 0) {
            ARROW_ASSIGN_OR_RAISE(column, arrow::MakeArrayOfNull(chunked->type(), 0));
        } else {
            column = chunked->chunk(0);
        }
        ARROW_ASSIGN_OR_RAISE(auto codec, ResolveCodec(*column));
        definitions.push_back(ColumnDefinition(combined->field(i)->name(), codec));
        columns.push_back(std::move(column));
        codecs.push_back(codec);
    }

    std::vector<std::string> statements;

    std::string create = "create table " + path + " (";
    for (size_t i = 0; i < definitions.size(); ++i) {
        if (i > 0) {
            create += ", ";
        }
        create += definitions[i];
    }
    create += ");";
    statements.push_back(std::move(create));

    if (combined->num_rows() == 0) {
        return statements;
    }

    std::string insert = "insert into " + path;
    for (int64_t row = 0; row < combined->num_rows(); ++row) {
        insert += "\n  values(";
        for (size_t col = 0; col < columns.size(); ++col) {
            if (col > 0) {
                insert += ", ";
            }
            ARROW_ASSIGN_OR_RAISE(auto literal, RenderLiteral(codecs[col], *columns[col], row));
            insert += literal;
        }
        insert += ")";
    }
    insert += ";";
    statements.push_back(std::move(insert));
    return statements;
}

arrow::Status FrameWriter::Write(const arrow::Table& frame, const std::string& table,
                                 const std::string& libref) {
    const std::string path = TablePath(table, libref);
    ARROW_ASSIGN_OR_RAISE(auto statements, BuildStatements(frame, path));

    for (const auto& statement : statements) {
        try {
            session.Execute(statement);
        } catch (const SessionStateError&) {
            throw;
        } catch (const std::runtime_error& e) {
            LOG_ERROR("writer", std::string("Statement failed for ") + path + ": " + e.what());
            return arrow::Status::IOError("Writing ", path, " failed: ", e.what());
        }
    }

    ILOG_DEBUG("writer", "Wrote {} rows x {} columns to {}", frame.num_rows(), frame.num_columns(), path);
    return arrow::Status::OK();
}

} // namespace iomclient
