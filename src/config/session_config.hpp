//===----------------------------------------------------------------------===//
//                         IOM Client
//
// config/session_config.hpp
//
// Session configuration: connection parameters, transfer tuning and the
// lock-down override policy
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <parallel_hashmap/phmap.h>

namespace iomclient {

// Literal substitution applied to captured rich output
struct OutputFixup {
    std::string from;
    std::string to;
};

using FormatNameSet = phmap::flat_hash_set<std::string>;

struct SessionConfig {
    // Connection. No host means a local loopback workspace.
    std::optional<std::string> host;
    uint16_t port = 0;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::string class_id;
    std::string provider = "sas.iomprovider";
    std::string encoding = "utf-8";

    // Cursor transfer tuning
    int32_t max_open_rows = DEFAULT_MAX_OPEN_ROWS;
    int32_t page_size = DEFAULT_PAGE_SIZE;
    int32_t cache_size = DEFAULT_CACHE_SIZE;

    // Stream pump chunk sizes
    size_t log_buffer = DEFAULT_FLUSH_BUFFER_SIZE;
    size_t listing_buffer = DEFAULT_FLUSH_BUFFER_SIZE;
    size_t file_buffer = DEFAULT_FLUSH_BUFFER_SIZE;

    // Rich output
    std::string output = "html5";
    std::string html_style = "HTMLBlue";
    std::vector<OutputFixup> output_fixups = DefaultOutputFixups();

    // Display-format families that carry calendar values
    FormatNameSet date_formats = DefaultDateFormats();
    FormatNameSet datetime_formats = DefaultDatetimeFormats();

    // When set, keyword overrides after loading are rejected
    bool lock_down = true;

    std::string profile_name;

    bool IsRemote() const { return host.has_value() && !host->empty(); }

    bool IsDateFormat(const std::string& format_name) const;
    bool IsDatetimeFormat(const std::string& format_name) const;

    // Single override entry point keyed by field name. Honored only when
    // lock_down is false; otherwise the value is dropped with a warning.
    bool TryOverride(const std::string& key, const std::string& value);

    // Apply overrides in order; returns how many were honored
    size_t ApplyOverrides(const std::vector<std::pair<std::string, std::string>>& overrides);

    bool Validate(std::string& error) const;

    // Load the named profile (or the file's `default`) from a YAML file
    bool LoadFromYaml(const std::string& path, const std::string& profile, std::string& error);
    bool LoadFromYamlString(const std::string& text, const std::string& profile, std::string& error);

    static std::vector<OutputFixup> DefaultOutputFixups();
    static FormatNameSet DefaultDateFormats();
    static FormatNameSet DefaultDatetimeFormats();
};

} // namespace iomclient
