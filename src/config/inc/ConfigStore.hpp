#pragma once

#include "GlobalSettings.hpp"
#include "ResolvedSyncSpec.hpp"
#include "SyncDeclaration.hpp"
#include "VariableSubstitutor.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

// Loaded configuration file. Immutable after construction, so concurrent
// resolve_sync() calls are safe.
class ConfigStore {
public:
    // Throws ConfigNotFoundError, ConfigParseError or ConfigSchemaError.
    explicit ConfigStore(const std::string& config_path);

    static ConfigStore from_string(const std::string& yaml_text, const std::string& origin = "<memory>");

    // ~/.config/arsync.conf
    static std::string default_path();

    // Throws UnknownSyncError when the name is not declared and
    // ConfigSchemaError when its declaration is malformed.
    ResolvedSyncSpec resolve_sync(const std::string& name) const;

    std::vector<std::string> list_syncs() const;

    const std::string& effective_flags() const { return settings_.rsync_flags; }
    const GlobalSettings& settings() const { return settings_; }
    const VariableMap& variables() const { return variables_; }
    const std::string& path() const { return path_; }

private:
    struct SyncEntry {
        std::string name;
        std::optional<SyncDeclaration> declaration;
        std::string error;  // set when the declaration could not be decoded
    };

    ConfigStore() = default;

    void load(const YAML::Node& root);
    void parse_variables(const YAML::Node& variables_node);
    void parse_settings(const YAML::Node& config_node);
    void parse_syncs(const YAML::Node& sync_node);

    std::string resolve_field(const std::string& raw, std::vector<std::string>& undefined) const;

    std::string path_;
    VariableMap variables_;
    GlobalSettings settings_;
    std::vector<SyncEntry> syncs_;  // declaration order
    std::unordered_map<std::string, size_t> sync_index_;
};
