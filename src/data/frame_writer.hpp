//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/frame_writer.hpp
//
// Local Arrow table -> remote table via create/insert statements
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

#include <arrow/api.h>
#include <variant>

namespace iomclient {

namespace codec {

struct Numeric {};

struct String {
    int32_t length = 1;
};

struct DateTime {};

// Any other local type, rendered through its scalar text form
struct Fallback {
    int32_t length = 1;
};

} // namespace codec

// Remote column definition and literal rendering for one local column.
// Resolved once per column from the column's Arrow type.
using ColumnCodec = std::variant<codec::Numeric, codec::String, codec::DateTime, codec::Fallback>;

class FrameWriter {
public:
    explicit FrameWriter(Session& session_p);

    // Create `table` with one column per frame column, then insert every
    // row in a single statement. An empty frame only creates the table.
    arrow::Status Write(const arrow::Table& frame, const std::string& table,
                        const std::string& libref = "");

    // Codec for a column; character lengths come from the longest value
    static arrow::Result<ColumnCodec> ResolveCodec(const arrow::Array& column);

    // `'name'n num`, `'name'n char(N)`, ...
    static std::string ColumnDefinition(const std::string& name, const ColumnCodec& codec);

    // Literal for one cell, or NULL when the cell is missing
    static arrow::Result<std::string> RenderLiteral(const ColumnCodec& codec,
                                                    const arrow::Array& column, int64_t row);

    // The create and insert statements Write() executes
    static arrow::Result<std::vector<std::string>> BuildStatements(const arrow::Table& frame,
                                                                   const std::string& path);

private:
    Session& session;
};

} // namespace iomclient
