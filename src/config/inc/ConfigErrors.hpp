#pragma once

#include <stdexcept>
#include <string>

// Base class for everything that makes a configuration unusable.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigNotFoundError : public ConfigError {
public:
    explicit ConfigNotFoundError(const std::string& msg) : ConfigError(msg) {}
};

class ConfigParseError : public ConfigError {
public:
    explicit ConfigParseError(const std::string& msg) : ConfigError(msg) {}
};

class ConfigSchemaError : public ConfigError {
public:
    explicit ConfigSchemaError(const std::string& msg) : ConfigError(msg) {}
};

// A requested sync name is not declared; the message lists the declared ones.
class UnknownSyncError : public ConfigError {
public:
    explicit UnknownSyncError(const std::string& msg) : ConfigError(msg) {}
};
