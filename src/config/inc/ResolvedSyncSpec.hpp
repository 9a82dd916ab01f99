#pragma once

#include <string>
#include <vector>

struct ResolvedSyncSpec {
    std::string name;
    std::string src;
    std::string dest;
    std::string flags;
    std::vector<std::string> undefined_variables;
};
