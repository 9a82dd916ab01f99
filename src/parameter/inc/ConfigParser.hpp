#pragma once

#include "GlobalSettings.hpp"
#include "LogUtils.hpp"
#include "SyncDeclaration.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>


namespace YAML {

    // Keys outside valid_keys are logged and returned; they are not an error
    inline std::vector<std::string> warn_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        std::vector<std::string> unknown;
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                LogUtils::warn("Ignoring unknown configuration key in {}: {}", context, key);
                unknown.push_back(key);
            }
        }
        return unknown;
    }

    inline std::string require_string(const YAML::Node& node, const std::string& key, const std::string& context) {
        if (!node[key] || node[key].IsNull()) {
            throw std::runtime_error("Missing required field '" + key + "' in " + context + ".");
        }
        if (!node[key].IsScalar()) {
            throw std::runtime_error("Field '" + key + "' in " + context + " must be a string.");
        }
        return node[key].as<std::string>();
    }

    template<>
    struct convert<SyncDeclaration> {
        static bool decode(const Node& node, SyncDeclaration& rhs) {
            if (!node.IsMap()) {
                throw std::runtime_error("A sync entry must be a mapping with 'src' and 'dest'.");
            }

            static const std::set<std::string> valid_keys = {"src", "dest"};
            warn_unknown_keys(node, valid_keys, "sync");

            rhs.src = require_string(node, "src", "sync");
            rhs.dest = require_string(node, "dest", "sync");
            return true;
        }
    };

    template<>
    struct convert<GlobalSettings> {
        static bool decode(const Node& node, GlobalSettings& rhs) {
            if (node.IsNull()) {
                return true;
            }
            if (!node.IsMap()) {
                throw std::runtime_error("The 'config' section must be a mapping.");
            }

            static const std::set<std::string> valid_keys = {"rsync_flags", "verbose"};
            warn_unknown_keys(node, valid_keys, "config");

            if (node["rsync_flags"] && !node["rsync_flags"].IsNull()) {
                rhs.rsync_flags = node["rsync_flags"].as<std::string>();
            }
            if (node["verbose"] && !node["verbose"].IsNull()) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            return true;
        }
    };

}
