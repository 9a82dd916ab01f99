#pragma once

#include <string>
#include <vector>

// Exact argument vector for one transfer.
struct Invocation {
    std::vector<std::string> argv;
    bool uses_credential_wrapper = false;

    // Name of the transfer tool, even when wrapped by the credential helper
    std::string tool() const;

    // Space-joined command line with the password masked
    std::string display() const;
};
