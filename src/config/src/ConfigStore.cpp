#include "ConfigStore.hpp"
#include "ConfigErrors.hpp"
#include "ConfigParser.hpp"
#include "LogUtils.hpp"
#include "PathResolver.hpp"
#include "StringUtils.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <system_error>

ConfigStore::ConfigStore(const std::string& config_path) : path_(config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        throw ConfigNotFoundError("Configuration file not found: " + config_path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::BadFile&) {
        throw ConfigNotFoundError("Configuration file not found: " + config_path);
    } catch (const YAML::ParserException& e) {
        throw ConfigParseError("Invalid YAML in config file: " + std::string(e.what()));
    }

    load(root);
    LogUtils::debug("Loaded {} sync(s) and {} variable(s) from {}", syncs_.size(), variables_.size(), path_);
}

ConfigStore ConfigStore::from_string(const std::string& yaml_text, const std::string& origin) {
    ConfigStore store;
    store.path_ = origin;

    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::ParserException& e) {
        throw ConfigParseError("Invalid YAML in config file: " + std::string(e.what()));
    }

    store.load(root);
    return store;
}

std::string ConfigStore::default_path() {
    return PathResolver::home_directory() + "/.config/arsync.conf";
}

void ConfigStore::load(const YAML::Node& root) {
    if (!root.IsMap() || !root["sync"] || !root["sync"].IsMap()) {
        throw ConfigSchemaError("Config file must contain a 'sync' section");
    }

    if (root["variables"]) {
        parse_variables(root["variables"]);
    }
    if (root["config"]) {
        parse_settings(root["config"]);
    }

    try {
        parse_syncs(root["sync"]);
    } catch (const YAML::Exception& e) {
        throw ConfigSchemaError("Invalid 'sync' section: " + std::string(e.what()));
    }
}

void ConfigStore::parse_variables(const YAML::Node& variables_node) {
    if (variables_node.IsNull()) {
        return;
    }
    if (!variables_node.IsSequence()) {
        LogUtils::warn("Ignoring 'variables' in {}: expected a list of KEY=VALUE strings", path_);
        return;
    }

    for (const auto& entry : variables_node) {
        if (!entry.IsScalar()) {
            continue;
        }

        const std::string definition = entry.as<std::string>();
        size_t eq = definition.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = definition.substr(0, eq);
        std::string value = definition.substr(eq + 1);
        StringUtils::trim(key);
        StringUtils::trim(value);
        StringUtils::strip_chars(value, "\"'");

        if (key.empty()) {
            continue;
        }
        variables_[key] = value;
    }
}

void ConfigStore::parse_settings(const YAML::Node& config_node) {
    try {
        settings_ = config_node.as<GlobalSettings>();
    } catch (const std::runtime_error& e) {
        throw ConfigSchemaError("Invalid 'config' section: " + std::string(e.what()));
    }
}

void ConfigStore::parse_syncs(const YAML::Node& sync_node) {
    for (auto it = sync_node.begin(); it != sync_node.end(); ++it) {
        SyncEntry entry;
        entry.name = it->first.as<std::string>();

        // Malformed entries only fail the job that uses them
        try {
            entry.declaration = it->second.as<SyncDeclaration>();
        } catch (const std::runtime_error& e) {
            entry.error = e.what();
        }

        auto existing = sync_index_.find(entry.name);
        if (existing != sync_index_.end()) {
            syncs_[existing->second] = std::move(entry);
        } else {
            sync_index_.emplace(entry.name, syncs_.size());
            syncs_.push_back(std::move(entry));
        }
    }
}

std::string ConfigStore::resolve_field(const std::string& raw, std::vector<std::string>& undefined) const {
    // Remote detection looks at the raw text, before any substitution
    std::string value = PathResolver::is_remote(raw) ? raw : PathResolver::normalize(raw);

    auto substituted = VariableSubstitutor::substitute(value, variables_);
    undefined.insert(undefined.end(), substituted.undefined.begin(), substituted.undefined.end());
    return substituted.text;
}

ResolvedSyncSpec ConfigStore::resolve_sync(const std::string& name) const {
    auto it = sync_index_.find(name);
    if (it == sync_index_.end()) {
        throw UnknownSyncError(fmt::format("Sync '{}' not found. Available syncs: {}",
                                           name, fmt::join(list_syncs(), ", ")));
    }

    const SyncEntry& entry = syncs_[it->second];
    if (!entry.declaration) {
        throw ConfigSchemaError(fmt::format("Invalid sync '{}': {}", name, entry.error));
    }

    ResolvedSyncSpec spec;
    spec.name = name;
    spec.src = resolve_field(entry.declaration->src, spec.undefined_variables);
    spec.dest = resolve_field(entry.declaration->dest, spec.undefined_variables);
    spec.flags = settings_.rsync_flags;

    for (const auto& variable : spec.undefined_variables) {
        LogUtils::warn("Variable ${{{}}} not defined", variable);
    }
    return spec;
}

std::vector<std::string> ConfigStore::list_syncs() const {
    std::vector<std::string> names;
    names.reserve(syncs_.size());
    for (const auto& entry : syncs_) {
        names.push_back(entry.name);
    }
    return names;
}
