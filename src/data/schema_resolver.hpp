//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/schema_resolver.hpp
//
// Column metadata interrogation and per-column value conversion
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "broker/broker.hpp"
#include "data/value.hpp"
#include <parallel_hashmap/phmap.h>

namespace iomclient {

enum class ConversionKind {
    IDENTITY,
    DAYS_SINCE_EPOCH,     // date formats: numeric days -> Date
    SECONDS_SINCE_EPOCH   // datetime formats: numeric seconds -> DateTime
};

struct ColumnConversion {
    ConversionKind kind = ConversionKind::IDENTITY;

    Value Apply(const broker::RemoteValue& raw) const;
};

struct ColumnMetadata {
    std::string name;
    std::string format_name;
    int32_t format_length = 0;
    int32_t format_decimal = 0;
    bool is_character = false;
    ColumnConversion conversion;
};

// Columns in table order with lookup by name
class TableSchema {
public:
    void Add(ColumnMetadata column);

    const ColumnMetadata* Find(const std::string& name) const;
    const std::vector<ColumnMetadata>& Columns() const { return columns_; }
    size_t Size() const { return columns_.size(); }
    bool Empty() const { return columns_.empty(); }

private:
    std::vector<ColumnMetadata> columns_;
    phmap::flat_hash_map<std::string, size_t> index_;
};

class SchemaResolver {
public:
    explicit SchemaResolver(Session& session_p);

    // Query column metadata for `libref.table`. Conversions are derived
    // from the format name alone; nothing is cached between calls.
    TableSchema Resolve(const std::string& table, const std::string& libref = "");

    // True when the metadata query returns at least one row
    bool Exists(const std::string& table, const std::string& libref = "");

    // Conversion for a display-format name
    ColumnConversion ConversionFor(const std::string& format_name) const;

private:
    Session& session;
};

} // namespace iomclient
