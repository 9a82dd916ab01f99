#pragma once

#include "ProcessUtils.hpp"

#include <string>
#include <vector>

// Abstract base class: how an invocation is turned into a finished process.
// Implementations must tolerate concurrent calls.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessUtils::ProcessResult run(const std::vector<std::string>& argv) = 0;
};

// Forks and execs the real program
class SystemProcessRunner : public ProcessRunner {
public:
    ProcessUtils::ProcessResult run(const std::vector<std::string>& argv) override;
};
