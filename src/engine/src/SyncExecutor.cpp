#include "SyncExecutor.hpp"
#include "LogUtils.hpp"
#include "ProcessErrors.hpp"

#include <fmt/format.h>

SyncExecutor::SyncExecutor(const ConfigStore& config, const CommandBuilder& builder, ProcessRunner& runner)
    : config_(config), builder_(builder), runner_(runner) {}

SyncResult SyncExecutor::run(const std::string& name) const {
    try {
        ResolvedSyncSpec spec = config_.resolve_sync(name);
        Invocation invocation = builder_.build(spec, false);

        LogUtils::info("Running sync '{}': {}", name, invocation.display());

        ProcessUtils::ProcessResult result = runner_.run(invocation.argv);
        if (result.exit_code != 0) {
            throw ProcessExecutionError(invocation.tool(), result.exit_code, result.stderr_text);
        }

        LogUtils::debug("Sync '{}' finished", name);
        return SyncResult{true, result.stdout_text};

    } catch (const ProcessExecutionError& e) {
        LogUtils::debug("Sync '{}' exited with code {}", name, e.exit_code());
        return SyncResult{false, e.what()};

    } catch (const std::exception& e) {
        LogUtils::debug("Sync '{}' could not run: {}", name, e.what());
        return SyncResult{false, fmt::format("Error running sync '{}': {}", name, e.what())};
    }
}
