#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static void read_yaml_map(const YAML::Node& node, std::map<std::string, std::string>& opts,
                          bool allow_sections) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (!it->first.IsScalar())
            continue;
        const std::string key = it->first.as<std::string>();
        const YAML::Node& val = it->second;
        if (val.IsMap()) {
            if (allow_sections)
                read_yaml_map(val, opts, false);
            continue;
        }
        std::string s;
        if (to_string_value(val, s))
            opts["--" + key] = s;
    }
}

static void read_json_object(const nlohmann::json& node, std::map<std::string, std::string>& opts,
                             bool allow_sections) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const auto& val = it.value();
        if (val.is_object()) {
            if (allow_sections)
                read_json_object(val, opts, false);
            continue;
        }
        std::string s;
        if (to_string_value(val, s))
            opts["--" + it.key()] = s;
    }
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        read_yaml_map(root, opts, true);
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        read_json_object(root, opts, true);
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
