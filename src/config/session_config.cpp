//===----------------------------------------------------------------------===//
//                         IOM Client
//
// config/session_config.cpp
//
// Session configuration loading and override policy
//===----------------------------------------------------------------------===//

#include "config/session_config.hpp"
#include "config/yaml_config.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <limits>

namespace iomclient {

namespace {

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool ParseInt(const std::string& text, long long min_val, long long max_val, long long& out) {
    if (text.empty()) {
        return false;
    }
    size_t pos = 0;
    long long v;
    try {
        v = std::stoll(text, &pos);
    } catch (const std::logic_error&) {
        return false;
    }
    if (pos != text.size() || v < min_val || v > max_val) {
        return false;
    }
    out = v;
    return true;
}

// Keys owned by the hosting session object; never taken from keywords
bool IsReservedKey(const std::string& key) {
    return key == "kernel" || key == "sb";
}

} // anonymous namespace

bool SessionConfig::IsDateFormat(const std::string& format_name) const {
    return date_formats.count(ToUpper(format_name)) > 0;
}

bool SessionConfig::IsDatetimeFormat(const std::string& format_name) const {
    return datetime_formats.count(ToUpper(format_name)) > 0;
}

bool SessionConfig::TryOverride(const std::string& key, const std::string& value) {
    if (IsReservedKey(key)) {
        LOG_DEBUG("config", "Ignoring reserved parameter '" + key + "'");
        return false;
    }
    if (lock_down) {
        LOG_WARN("config", "Param '" + key + "' was ignored due to configuration restriction");
        return false;
    }

    long long n = 0;
    auto int_field = [&](long long lo, long long hi, const std::function<void(long long)>& assign) {
        if (!ParseInt(value, lo, hi, n)) {
            LOG_WARN("config", "Param '" + key + "' has invalid value '" + value + "'");
            return false;
        }
        assign(n);
        return true;
    };

    if (key == "host") {
        if (value.empty()) host.reset(); else host = value;
    } else if (key == "port") {
        return int_field(1, 65535, [this](long long v) { port = static_cast<uint16_t>(v); });
    } else if (key == "user") {
        user = value;
    } else if (key == "password" || key == "pw") {
        password = value;
    } else if (key == "class_id") {
        class_id = value;
    } else if (key == "provider") {
        provider = value;
    } else if (key == "encoding") {
        encoding = value;
    } else if (key == "max_open_rows" || key == "max_rows") {
        return int_field(1, std::numeric_limits<int32_t>::max(),
                         [this](long long v) { max_open_rows = static_cast<int32_t>(v); });
    } else if (key == "page_size" || key == "pagesize") {
        return int_field(1, std::numeric_limits<int32_t>::max(),
                         [this](long long v) { page_size = static_cast<int32_t>(v); });
    } else if (key == "cache_size" || key == "cachesize") {
        return int_field(1, std::numeric_limits<int32_t>::max(),
                         [this](long long v) { cache_size = static_cast<int32_t>(v); });
    } else if (key == "log_buffer") {
        return int_field(1, std::numeric_limits<int32_t>::max(),
                         [this](long long v) { log_buffer = static_cast<size_t>(v); });
    } else if (key == "listing_buffer") {
        return int_field(1, std::numeric_limits<int32_t>::max(),
                         [this](long long v) { listing_buffer = static_cast<size_t>(v); });
    } else if (key == "file_buffer") {
        return int_field(1, std::numeric_limits<int32_t>::max(),
                         [this](long long v) { file_buffer = static_cast<size_t>(v); });
    } else if (key == "output") {
        output = value;
    } else if (key == "html_style") {
        html_style = value;
    } else {
        LOG_WARN("config", "Param '" + key + "' is not a recognized configuration option");
        return false;
    }
    return true;
}

size_t SessionConfig::ApplyOverrides(const std::vector<std::pair<std::string, std::string>>& overrides) {
    size_t honored = 0;
    for (const auto& kv : overrides) {
        if (TryOverride(kv.first, kv.second)) {
            honored++;
        }
    }
    return honored;
}

bool SessionConfig::Validate(std::string& error) const {
    if (IsRemote()) {
        if (port == 0) {
            error = "Remote connection requires a port";
            return false;
        }
        if (class_id.empty()) {
            error = "Remote connection requires a class_id";
            return false;
        }
    }
    if (log_buffer == 0 || listing_buffer == 0 || file_buffer == 0) {
        error = "Buffer sizes must be greater than 0";
        return false;
    }
    if (max_open_rows <= 0 || page_size <= 0 || cache_size <= 0) {
        error = "Cursor cache sizes must be greater than 0";
        return false;
    }
    return true;
}

static bool LoadProfile(const YamlConfig& cfg, SessionConfig& config,
                        const std::string& profile, std::string& error) {
    std::string name = profile.empty() ? cfg.GetString("default") : profile;
    if (name.empty()) {
        error = "No profile requested and no default profile configured";
        return false;
    }
    const std::string base = "profiles." + name;
    if (!cfg.Has(base)) {
        error = "Configuration profile '" + name + "' not found";
        return false;
    }
    config.profile_name = name;

    if (cfg.Has(base + ".iomhost")) config.host = cfg.GetString(base + ".iomhost");
    if (cfg.Has(base + ".iomport")) config.port = static_cast<uint16_t>(cfg.GetInt(base + ".iomport"));
    if (cfg.Has(base + ".omruser")) config.user = cfg.GetString(base + ".omruser");
    if (cfg.Has(base + ".omrpw")) config.password = cfg.GetString(base + ".omrpw");
    if (cfg.Has(base + ".class_id")) config.class_id = cfg.GetString(base + ".class_id");
    if (cfg.Has(base + ".provider")) config.provider = cfg.GetString(base + ".provider");
    if (cfg.Has(base + ".encoding")) config.encoding = cfg.GetString(base + ".encoding");
    if (cfg.Has(base + ".max_open_rows")) config.max_open_rows = cfg.GetInt(base + ".max_open_rows");
    if (cfg.Has(base + ".pagesize")) config.page_size = cfg.GetInt(base + ".pagesize");
    if (cfg.Has(base + ".cachesize")) config.cache_size = cfg.GetInt(base + ".cachesize");
    if (cfg.Has(base + ".log_buffer")) config.log_buffer = static_cast<size_t>(cfg.GetInt(base + ".log_buffer"));
    if (cfg.Has(base + ".listing_buffer")) config.listing_buffer = static_cast<size_t>(cfg.GetInt(base + ".listing_buffer"));
    if (cfg.Has(base + ".file_buffer")) config.file_buffer = static_cast<size_t>(cfg.GetInt(base + ".file_buffer"));

    if (cfg.Has("output.output")) config.output = cfg.GetString("output.output");
    if (cfg.Has("output.style")) config.html_style = cfg.GetString("output.style");
    if (cfg.Has("output.fixups")) {
        config.output_fixups.clear();
        for (auto& pair : cfg.GetPairList("output.fixups", "from", "to")) {
            config.output_fixups.push_back({std::move(pair.first), std::move(pair.second)});
        }
    }

    if (cfg.Has("formats.date")) {
        config.date_formats.clear();
        for (const auto& f : cfg.GetStringList("formats.date")) {
            config.date_formats.insert(ToUpper(f));
        }
    }
    if (cfg.Has("formats.datetime")) {
        config.datetime_formats.clear();
        for (const auto& f : cfg.GetStringList("formats.datetime")) {
            config.datetime_formats.insert(ToUpper(f));
        }
    }

    config.lock_down = cfg.GetBool("options.lock_down", true);
    return config.Validate(error);
}

bool SessionConfig::LoadFromYaml(const std::string& path, const std::string& profile, std::string& error) {
    YamlConfig cfg;
    if (!cfg.Load(path)) {
        error = cfg.GetError();
        return false;
    }
    return LoadProfile(cfg, *this, profile, error);
}

bool SessionConfig::LoadFromYamlString(const std::string& text, const std::string& profile, std::string& error) {
    YamlConfig cfg;
    if (!cfg.LoadString(text)) {
        error = cfg.GetError();
        return false;
    }
    return LoadProfile(cfg, *this, profile, error);
}

std::vector<OutputFixup> SessionConfig::DefaultOutputFixups() {
    return {
        {"\x0c", "\n"},
        {"<body class=\"c body\">", "<body class=\"l body\">"},
        {"font-size: x-small;", "font-size: normal;"},
    };
}

FormatNameSet SessionConfig::DefaultDateFormats() {
    return {
        "B8601DA", "DATE", "DAY", "DDMMYY", "DDMMYYB", "DDMMYYC", "DDMMYYD",
        "DDMMYYN", "DDMMYYP", "DDMMYYS", "DOWNAME", "E8601DA", "JULDAY",
        "JULIAN", "MMDDYY", "MMDDYYB", "MMDDYYC", "MMDDYYD", "MMDDYYN",
        "MMDDYYP", "MMDDYYS", "MMYY", "MMYYC", "MMYYD", "MMYYN", "MMYYP",
        "MMYYS", "MONNAME", "MONTH", "MONYY", "NLDATE", "NLDATEL", "NLDATEM",
        "NLDATES", "NLDATEW", "QTR", "QTRR", "WEEKDATE", "WEEKDATX", "WEEKDAY",
        "WEEKU", "WEEKV", "WEEKW", "WORDDATE", "WORDDATX", "YEAR", "YYMM",
        "YYMMC", "YYMMD", "YYMMDD", "YYMMDDB", "YYMMDDC", "YYMMDDD", "YYMMDDN",
        "YYMMDDP", "YYMMDDS", "YYMMN", "YYMMP", "YYMMS", "YYMON", "YYQ", "YYQC",
        "YYQD", "YYQN", "YYQP", "YYQR", "YYQRC", "YYQRD", "YYQRN", "YYQRP",
        "YYQRS", "YYQS",
    };
}

FormatNameSet SessionConfig::DefaultDatetimeFormats() {
    return {
        "B8601DN", "B8601DT", "B8601DX", "B8601DZ", "B8601LX", "DATEAMPM",
        "DATETIME", "DTDATE", "DTMONYY", "DTWKDATX", "DTYEAR", "DTYYQC",
        "E8601DN", "E8601DT", "E8601DX", "E8601DZ", "E8601LX", "MDYAMPM",
        "NLDATM", "NLDATMAP", "NLDATML", "NLDATMM", "NLDATMS", "NLDATMW",
    };
}

} // namespace iomclient
