#pragma once

#include <stdexcept>
#include <string>

// The external tool could not be launched at all.
class ProcessSpawnError : public std::runtime_error {
public:
    explicit ProcessSpawnError(const std::string& msg) : std::runtime_error(msg) {}
};

// The external tool ran and exited with a non-zero status.
class ProcessExecutionError : public std::runtime_error {
public:
    ProcessExecutionError(const std::string& tool, int exit_code, const std::string& stderr_text)
        : std::runtime_error(tool + " failed: " + stderr_text),
          tool_(tool), exit_code_(exit_code), stderr_text_(stderr_text) {}

    const std::string& tool() const { return tool_; }
    int exit_code() const { return exit_code_; }
    const std::string& stderr_text() const { return stderr_text_; }

private:
    std::string tool_;
    int exit_code_;
    std::string stderr_text_;
};
