#pragma once

#include "Invocation.hpp"
#include "ResolvedSyncSpec.hpp"
#include "SecretProvider.hpp"

#include <string>

class CommandBuilder {
public:
    static constexpr const char* TRANSFER_TOOL = "rsync";
    static constexpr const char* CREDENTIAL_WRAPPER = "sshpass";

    explicit CommandBuilder(SecretProvider& secrets, std::string ssh_key_path = default_ssh_key_path());

    // ~/.ssh/id_rsa
    static std::string default_ssh_key_path();

    // Remote sources without a key file get wrapped in sshpass, except on dry
    // runs, which never prompt. Only that branch calls the SecretProvider.
    Invocation build(const ResolvedSyncSpec& spec, bool dry_run) const;

    const std::string& ssh_key_path() const { return ssh_key_path_; }

private:
    bool has_ssh_key() const;

    SecretProvider& secrets_;
    std::string ssh_key_path_;
};
