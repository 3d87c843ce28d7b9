//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/schema_resolver.cpp
//
// Schema resolver implementation
//===----------------------------------------------------------------------===//

#include "data/schema_resolver.hpp"
#include "data/dataset_options.hpp"
#include "session/session.hpp"
#include "logging/logger.hpp"
#include <cmath>

namespace iomclient {

namespace {

// Provider data type codes for character columns
bool IsCharacterType(int32_t code) {
    return code == 129 || code == 130 || code == 200 || code == 201 || code == 202 || code == 203;
}

int32_t AsInt(const broker::RemoteValue& v) {
    if (auto d = std::get_if<double>(&v)) {
        return static_cast<int32_t>(std::lround(*d));
    }
    if (auto s = std::get_if<std::string>(&v)) {
        try {
            return std::stoi(*s);
        } catch (const std::logic_error&) {
            return 0;
        }
    }
    return 0;
}

std::string AsString(const broker::RemoteValue& v) {
    if (auto s = std::get_if<std::string>(&v)) {
        return *s;
    }
    return "";
}

} // anonymous namespace

Value ColumnConversion::Apply(const broker::RemoteValue& raw) const {
    if (std::holds_alternative<std::monostate>(raw)) {
        return std::monostate{};
    }
    if (auto s = std::get_if<std::string>(&raw)) {
        return *s;
    }

    double number = std::get<double>(raw);
    if (std::isnan(number)) {
        return std::monostate{};
    }
    switch (kind) {
        case ConversionKind::DAYS_SINCE_EPOCH:
            return calendar::FromEngineDays(number);
        case ConversionKind::SECONDS_SINCE_EPOCH:
            return calendar::FromEngineSeconds(number);
        case ConversionKind::IDENTITY:
        default:
            return number;
    }
}

void TableSchema::Add(ColumnMetadata column) {
    index_[column.name] = columns_.size();
    columns_.push_back(std::move(column));
}

const ColumnMetadata* TableSchema::Find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

SchemaResolver::SchemaResolver(Session& session_p)
    : session(session_p) {
}

ColumnConversion SchemaResolver::ConversionFor(const std::string& format_name) const {
    const auto& config = session.GetConfig();
    if (config.IsDateFormat(format_name)) {
        return ColumnConversion{ConversionKind::DAYS_SINCE_EPOCH};
    }
    if (config.IsDatetimeFormat(format_name)) {
        return ColumnConversion{ConversionKind::SECONDS_SINCE_EPOCH};
    }
    return ColumnConversion{ConversionKind::IDENTITY};
}

TableSchema SchemaResolver::Resolve(const std::string& table, const std::string& libref) {
    const std::string path = TablePath(table, libref);
    auto cursor = session.OpenColumnSchema(path);

    TableSchema schema;
    if (!cursor->IsEof()) {
        cursor->MoveFirst();
    }
    while (!cursor->IsEof()) {
        ColumnMetadata column;
        for (const auto& field : cursor->Fields()) {
            if (field.name == "COLUMN_NAME") {
                column.name = AsString(field.value);
            } else if (field.name == "FORMAT_NAME") {
                column.format_name = AsString(field.value);
            } else if (field.name == "FORMAT_LENGTH") {
                column.format_length = AsInt(field.value);
            } else if (field.name == "FORMAT_DECIMAL") {
                column.format_decimal = AsInt(field.value);
            } else if (field.name == "DATA_TYPE") {
                column.is_character = IsCharacterType(AsInt(field.value));
            }
        }
        column.conversion = ConversionFor(column.format_name);
        schema.Add(std::move(column));
        cursor->MoveNext();
    }
    cursor->Close();

    ILOG_DEBUG("schema", "Resolved {} columns for {}", schema.Size(), path);
    return schema;
}

bool SchemaResolver::Exists(const std::string& table, const std::string& libref) {
    auto cursor = session.OpenColumnSchema(TablePath(table, libref));
    bool exists = !cursor->IsBof();
    cursor->Close();
    return exists;
}

} // namespace iomclient
