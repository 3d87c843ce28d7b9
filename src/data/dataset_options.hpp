//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/dataset_options.hpp
//
// Table paths, dataset options and import/export statement options
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace iomclient {

// True for names usable without a name literal: letter or underscore
// first, then letters, digits, underscores; at most 32 characters
bool IsPlainName(const std::string& name);

// `'name'n` with embedded quotes doubled
std::string NameLiteral(const std::string& name);

// `libref.table`, or just `table` when no library is given
std::string TablePath(const std::string& table, const std::string& libref = "");

// Double-quoted string literal with embedded double quotes doubled
std::string QuoteString(const std::string& text);

// Filters, projections, row bounds and display formats applied when a
// table is materialized
struct DatasetOptions {
    std::vector<std::string> where;    // conditions joined with " and "
    std::vector<std::string> keep;
    std::vector<std::string> drop;
    std::optional<int64_t> obs;
    std::optional<int64_t> firstobs;
    std::vector<std::pair<std::string, std::string>> formats;  // column, format

    bool Empty() const;

    // "(where=(...) keep=... obs=N)" followed by ";\n\tformat ...;" when
    // formats are present. Empty when nothing is set.
    std::string Render() const;
};

struct ImportOptions {
    std::optional<int64_t> datarow;
    std::optional<char> delimiter;
    std::optional<bool> getnames;
    std::optional<int64_t> guessingrows;

    std::string Render() const;
};

struct ExportOptions {
    std::optional<char> delimiter;
    std::optional<bool> putnames;

    std::string Render() const;
};

} // namespace iomclient
