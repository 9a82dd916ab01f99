#pragma once

#include "CommandBuilder.hpp"
#include "ConfigStore.hpp"
#include "ProcessRunner.hpp"
#include "SyncResult.hpp"

#include <string>

// Runs a single sync end to end. Every failure ends up in the returned
// SyncResult; run() does not throw.
class SyncExecutor {
public:
    SyncExecutor(const ConfigStore& config, const CommandBuilder& builder, ProcessRunner& runner);

    SyncResult run(const std::string& name) const;

private:
    const ConfigStore& config_;
    const CommandBuilder& builder_;
    ProcessRunner& runner_;
};
