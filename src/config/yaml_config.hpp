//===----------------------------------------------------------------------===//
//                         IOM Client
//
// config/yaml_config.hpp
//
// YAML configuration file reader with dot-path lookup
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace iomclient {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
            return true;
        } catch (const YAML::ParserException& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "Cannot open config file: " + std::string(e.what());
            return false;
        }
    }

    bool LoadString(const std::string& text) {
        try {
            root_ = YAML::Load(text);
            return true;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    template<typename T>
    T Get(const std::string& path, const T& default_val) const {
        YAML::Node node = GetNode(path);
        if (!node || node.IsNull()) {
            return default_val;
        }
        try {
            return node.as<T>();
        } catch (const YAML::BadConversion&) {
            return default_val;
        }
    }

    std::string GetString(const std::string& path, const std::string& default_val = "") const {
        return Get<std::string>(path, default_val);
    }

    int GetInt(const std::string& path, int default_val = 0) const {
        return Get<int>(path, default_val);
    }

    bool GetBool(const std::string& path, bool default_val = false) const {
        return Get<bool>(path, default_val);
    }

    // Scalar sequence at `path`; non-scalar entries are skipped
    std::vector<std::string> GetStringList(const std::string& path) const {
        std::vector<std::string> out;
        YAML::Node node = GetNode(path);
        if (!node || !node.IsSequence()) {
            return out;
        }
        for (const auto& item : node) {
            if (item.IsScalar()) {
                out.push_back(item.as<std::string>());
            }
        }
        return out;
    }

    // Sequence of {from, to} maps at `path`
    std::vector<std::pair<std::string, std::string>> GetPairList(const std::string& path,
                                                                 const std::string& first_key,
                                                                 const std::string& second_key) const {
        std::vector<std::pair<std::string, std::string>> out;
        YAML::Node node = GetNode(path);
        if (!node || !node.IsSequence()) {
            return out;
        }
        for (const auto& item : node) {
            if (item.IsMap() && item[first_key] && item[second_key]) {
                out.emplace_back(item[first_key].as<std::string>(),
                                 item[second_key].as<std::string>());
            }
        }
        return out;
    }

    bool Has(const std::string& path) const {
        YAML::Node node = GetNode(path);
        return node && !node.IsNull();
    }

    const std::string& GetError() const { return error_; }

private:
    // Get node by dot-separated path (e.g., "profiles.winiom.iomhost")
    YAML::Node GetNode(const std::string& path) const {
        YAML::Node current = YAML::Clone(root_);

        size_t start = 0;
        size_t end;

        while ((end = path.find('.', start)) != std::string::npos) {
            std::string key = path.substr(start, end - start);
            if (!current.IsMap() || !current[key]) {
                return YAML::Node();
            }
            current = current[key];
            start = end + 1;
        }

        if (!current.IsMap()) {
            return YAML::Node();
        }
        return current[path.substr(start)];
    }

    YAML::Node root_;
    std::string error_;
};

} // namespace iomclient
