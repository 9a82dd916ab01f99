#include "SyncScheduler.hpp"
#include "LogUtils.hpp"

#include <fmt/format.h>
#include <set>
#include <system_error>
#include <thread>

SyncScheduler::SyncScheduler(const SyncExecutor& executor) : executor_(executor) {}

SyncResultSet SyncScheduler::run_all(const std::vector<std::string>& names, bool parallel) const {
    std::vector<std::string> unique_names;
    std::set<std::string> seen;
    for (const auto& name : names) {
        if (seen.insert(name).second) {
            unique_names.push_back(name);
        }
    }

    if (parallel && unique_names.size() > 1) {
        LogUtils::debug("Running {} syncs in parallel", unique_names.size());
        return run_parallel(unique_names);
    }
    return run_sequential(unique_names);
}

SyncResultSet SyncScheduler::run_sequential(const std::vector<std::string>& names) const {
    SyncResultSet results;
    for (const auto& name : names) {
        results[name] = run_one(name);
    }
    return results;
}

SyncResultSet SyncScheduler::run_parallel(const std::vector<std::string>& names) const {
    // Each worker owns exactly one slot; the map is built after the join
    std::vector<SyncResult> slots(names.size());
    std::vector<std::thread> workers;
    workers.reserve(names.size());

    for (size_t i = 0; i < names.size(); ++i) {
        try {
            workers.emplace_back([this, &names, &slots, i] {
                slots[i] = run_one(names[i]);
            });
        } catch (const std::system_error& e) {
            LogUtils::warn("Cannot start a thread for sync '{}' ({}), running it inline", names[i], e.what());
            slots[i] = run_one(names[i]);
        }
    }

    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }

    SyncResultSet results;
    for (size_t i = 0; i < names.size(); ++i) {
        results.emplace(names[i], std::move(slots[i]));
    }
    return results;
}

SyncResult SyncScheduler::run_one(const std::string& name) const {
    // An exception escaping a worker thread would terminate the process
    try {
        return executor_.run(name);
    } catch (const std::exception& e) {
        return SyncResult{false, fmt::format("Error running sync '{}': {}", name, e.what())};
    }
}
