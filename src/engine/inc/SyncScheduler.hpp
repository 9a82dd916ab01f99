#pragma once

#include "SyncExecutor.hpp"
#include "SyncResult.hpp"

#include <string>
#include <vector>

// Runs a set of syncs either one after another or one thread per sync.
class SyncScheduler {
public:
    explicit SyncScheduler(const SyncExecutor& executor);

    // Returns once every requested sync has finished, successfully or not.
    // Repeated names run once.
    SyncResultSet run_all(const std::vector<std::string>& names, bool parallel) const;

private:
    SyncResultSet run_sequential(const std::vector<std::string>& names) const;
    SyncResultSet run_parallel(const std::vector<std::string>& names) const;

    SyncResult run_one(const std::string& name) const;

    const SyncExecutor& executor_;
};
