#include "CommandBuilder.hpp"
#include "LogUtils.hpp"
#include "PathResolver.hpp"
#include "StringUtils.hpp"

#include <filesystem>
#include <system_error>

std::string Invocation::tool() const {
    // sshpass -p <password> rsync ...
    size_t index = uses_credential_wrapper ? 3 : 0;
    return index < argv.size() ? argv[index] : std::string();
}

std::string Invocation::display() const {
    std::vector<std::string> shown = argv;
    if (uses_credential_wrapper && shown.size() > 2) {
        shown[2] = "********";
    }
    return StringUtils::join(shown, " ");
}

CommandBuilder::CommandBuilder(SecretProvider& secrets, std::string ssh_key_path)
    : secrets_(secrets), ssh_key_path_(std::move(ssh_key_path)) {}

std::string CommandBuilder::default_ssh_key_path() {
    return PathResolver::home_directory() + "/.ssh/id_rsa";
}

bool CommandBuilder::has_ssh_key() const {
    std::error_code ec;
    return std::filesystem::exists(ssh_key_path_, ec);
}

Invocation CommandBuilder::build(const ResolvedSyncSpec& spec, bool dry_run) const {
    Invocation invocation;

    if (PathResolver::is_remote(spec.src) && !dry_run && !has_ssh_key()) {
        const std::string host = spec.src.substr(0, spec.src.find(':'));
        LogUtils::debug("No SSH key at {}, asking for the password of {}", ssh_key_path_, host);

        invocation.argv = {CREDENTIAL_WRAPPER, "-p", secrets_.obtain_secret(host)};
        invocation.uses_credential_wrapper = true;
    }

    invocation.argv.push_back(TRANSFER_TOOL);
    for (auto& flag : StringUtils::split_shell_words(spec.flags)) {
        invocation.argv.push_back(std::move(flag));
    }
    invocation.argv.push_back(spec.src);
    invocation.argv.push_back(spec.dest);
    return invocation;
}
