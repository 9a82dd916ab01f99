#pragma once

#include <mutex>
#include <string>

// Source of SSH passwords for hosts that have no usable key.
class SecretProvider {
public:
    virtual ~SecretProvider() = default;

    virtual std::string obtain_secret(const std::string& host) = 0;
};

// Prompts on the controlling terminal with echo disabled. Prompts from
// parallel jobs are serialized.
class TerminalSecretProvider : public SecretProvider {
public:
    std::string obtain_secret(const std::string& host) override;

private:
    std::mutex prompt_mutex_;
};
