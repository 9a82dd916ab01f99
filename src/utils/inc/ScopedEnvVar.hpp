#pragma once

#include <optional>
#include <string>

// Sets (or unsets) an environment variable for the lifetime of the object
// and restores the previous state on destruction.
class ScopedEnvVar {
private:
    std::string name_;
    std::string old_value_;
    bool had_old_value_;
    bool restored_ = false;

public:
    explicit ScopedEnvVar(const std::string& name, const std::optional<std::string>& new_value);

    ~ScopedEnvVar();

    void restore();

    // Deleted copy semantics
    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;
};
