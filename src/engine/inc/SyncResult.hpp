#pragma once

#include <map>
#include <string>

struct SyncResult {
    bool success = false;
    std::string output;  // stdout on success, diagnostic text on failure
};

// One entry per requested sync name
using SyncResultSet = std::map<std::string, SyncResult>;
