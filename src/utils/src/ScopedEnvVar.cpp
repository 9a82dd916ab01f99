#include "ScopedEnvVar.hpp"
#include "LogUtils.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

ScopedEnvVar::ScopedEnvVar(const std::string& name, const std::optional<std::string>& new_value)
    : name_(name), had_old_value_(false) {

    if (name_.empty()) {
        throw std::invalid_argument("ScopedEnvVar: environment variable name cannot be empty");
    }

    const char* old = getenv(name_.c_str());
    if (old != nullptr) {
        old_value_ = old;
        had_old_value_ = true;
    }

    if (new_value) {
        if (setenv(name_.c_str(), new_value->c_str(), 1) != 0) {
            throw std::runtime_error("ScopedEnvVar: setenv failed for " + name_);
        }
    } else {
        if (unsetenv(name_.c_str()) != 0) {
            throw std::runtime_error("ScopedEnvVar: unsetenv failed for " + name_);
        }
    }
}

ScopedEnvVar::~ScopedEnvVar() {
    try {
        restore();
    } catch (const std::exception& e) {
        LogUtils::error("{}", e.what());
    }
}

void ScopedEnvVar::restore() {
    if (restored_) return;
    restored_ = true;

    if (had_old_value_) {
        if (setenv(name_.c_str(), old_value_.c_str(), 1) != 0) {
            throw std::runtime_error("ScopedEnvVar: setenv failed (restore old)");
        }
    } else {
        if (unsetenv(name_.c_str()) != 0) {
            throw std::runtime_error("ScopedEnvVar: unsetenv failed");
        }
    }
}
