//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/dataset_options.cpp
//
// Rendering of table paths and statement options
//===----------------------------------------------------------------------===//

#include "data/dataset_options.hpp"
#include <cctype>
#include <cstdio>

namespace iomclient {

namespace {

std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string HexDelimiter(char delimiter) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "'%02x'x", static_cast<unsigned char>(delimiter));
    return buf;
}

} // anonymous namespace

bool IsPlainName(const std::string& name) {
    if (name.empty() || name.size() > 32) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_') {
            return false;
        }
    }
    return true;
}

std::string NameLiteral(const std::string& name) {
    return "'" + ReplaceAll(name, "'", "''") + "'n";
}

std::string TablePath(const std::string& table, const std::string& libref) {
    std::string name = IsPlainName(table) ? table : NameLiteral(table);
    if (libref.empty()) {
        return name;
    }
    return libref + "." + name;
}

std::string QuoteString(const std::string& text) {
    return "\"" + ReplaceAll(text, "\"", "\"\"") + "\"";
}

bool DatasetOptions::Empty() const {
    return where.empty() && keep.empty() && drop.empty() && !obs && !firstobs && formats.empty();
}

std::string DatasetOptions::Render() const {
    std::vector<std::string> parts;
    if (!where.empty()) {
        parts.push_back("where=(" + Join(where, " and ") + ")");
    }
    if (!keep.empty()) {
        parts.push_back("keep=" + Join(keep, " "));
    }
    if (!drop.empty()) {
        parts.push_back("drop=" + Join(drop, " "));
    }
    if (obs) {
        parts.push_back("obs=" + std::to_string(*obs));
    }
    if (firstobs) {
        parts.push_back("firstobs=" + std::to_string(*firstobs));
    }

    std::string out;
    if (!parts.empty()) {
        out = "(" + Join(parts, " ") + ")";
    }

    if (!formats.empty()) {
        std::vector<std::string> fmts;
        for (const auto& f : formats) {
            fmts.push_back(f.first + " " + f.second);
        }
        out += ";\n\tformat " + Join(fmts, " ") + ";";
    }
    return out;
}

std::string ImportOptions::Render() const {
    std::vector<std::string> parts;
    if (datarow) {
        parts.push_back("datarow=" + std::to_string(*datarow) + ";");
    }
    if (delimiter) {
        parts.push_back("delimiter=" + HexDelimiter(*delimiter) + ";");
    }
    if (getnames) {
        parts.push_back(std::string("getnames=") + (*getnames ? "YES" : "NO") + ";");
    }
    if (guessingrows) {
        parts.push_back("guessingrows=" + std::to_string(*guessingrows) + ";");
    }
    return Join(parts, "\n");
}

std::string ExportOptions::Render() const {
    std::vector<std::string> parts;
    if (delimiter) {
        parts.push_back("delimiter=" + HexDelimiter(*delimiter) + ";");
    }
    if (putnames) {
        parts.push_back(std::string("putnames=") + (*putnames ? "YES" : "NO") + ";");
    }
    return Join(parts, "\n");
}

} // namespace iomclient
