#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "ConfigStore.hpp"
#include "CommandBuilder.hpp"
#include "ProcessRunner.hpp"
#include "SecretProvider.hpp"
#include "SyncExecutor.hpp"
#include "SyncScheduler.hpp"
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

int list_syncs(const ConfigStore& config) {
    for (const auto& name : config.list_syncs()) {
        std::cout << name << "\n";
    }
    return 0;
}

// Per-sync errors are reported and do not stop the remaining previews
int preview_syncs(const ConfigStore& config, const CommandBuilder& builder, const std::vector<std::string>& names) {
    std::cout << "Dry run mode - would execute the following:" << std::endl;
    for (const auto& name : names) {
        try {
            ResolvedSyncSpec spec = config.resolve_sync(name);
            Invocation invocation = builder.build(spec, true);
            std::cout << "  " << name << ": " << invocation.display() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "  " << name << ": ERROR - " << e.what() << std::endl;
        }
    }
    return 0;
}

int report(const std::vector<std::string>& names, const SyncResultSet& results) {
    size_t success_count = 0;
    std::set<std::string> reported;

    // Request order; repeated names were run once and are reported once
    for (const auto& name : names) {
        auto it = results.find(name);
        if (it == results.end() || !reported.insert(name).second) {
            continue;
        }

        if (it->second.success) {
            std::cout << "✓ " << name << ": Success" << std::endl;
            ++success_count;
        } else {
            std::cout << "✗ " << name << ": Failed - " << it->second.output << std::endl;
        }
    }

    std::cout << "\nCompleted: " << success_count << "/" << results.size() << " syncs successful" << std::endl;
    return success_count == results.size() ? 0 : 1;
}

int run(const RunOptions& options) {
    if (options.refresh) {
        // Completion is regenerated by the shell wrapper; nothing to do here
        std::cout << "Refreshing bash completion..." << std::endl;
        std::cout << "Bash completion refreshed." << std::endl;
        return 0;
    }

    ConfigStore config(options.config_path);
    if (config.settings().verbose) {
        LogUtils::set_level(LogUtils::Level::Debug);
    }

    if (options.list) {
        return list_syncs(config);
    }

    std::vector<std::string> names = options.sync_names.empty() ? config.list_syncs() : options.sync_names;
    if (names.empty()) {
        std::cerr << "No sync operations defined in configuration" << std::endl;
        return 1;
    }

    TerminalSecretProvider secrets;
    CommandBuilder builder(secrets);

    if (options.dry_run) {
        return preview_syncs(config, builder, names);
    }

    SystemProcessRunner runner;
    SyncExecutor executor(config, builder, runner);
    SyncScheduler scheduler(executor);

    SyncResultSet results = scheduler.run_all(names, options.parallel);
    return report(names, results);
}

}

int main(int argc, char* argv[]) {
    int result = 0;

    LogUtils::init(LogUtils::Level::Info);

    try {
        ParameterContext context;

        if (context.init(argc, argv)) {
            const RunOptions& options = context.get_run_options();

            if (!options.log_file.empty()) {
                LogUtils::init(LogUtils::Level::Info, options.log_file);
            }
            if (options.verbose) {
                LogUtils::set_level(LogUtils::Level::Debug);
            }

            result = run(options);
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        LogUtils::debug("Use --help or -? to show usage information");
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
