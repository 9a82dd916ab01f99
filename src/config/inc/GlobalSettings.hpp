#pragma once

#include <string>

// The optional `config` section.
struct GlobalSettings {
    static constexpr const char* DEFAULT_RSYNC_FLAGS = "-avPh";

    std::string rsync_flags = DEFAULT_RSYNC_FLAGS;
    bool verbose = false;
};
