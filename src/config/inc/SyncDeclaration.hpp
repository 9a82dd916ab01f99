#pragma once

#include <string>

// One entry of the `sync` section, as authored.
struct SyncDeclaration {
    std::string src;
    std::string dest;
};
