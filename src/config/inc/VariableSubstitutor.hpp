#pragma once

#include <string>
#include <unordered_map>
#include <vector>

using VariableMap = std::unordered_map<std::string, std::string>;

namespace VariableSubstitutor {

struct SubstitutionResult {
    std::string text;
    std::vector<std::string> undefined;  // unresolved names, in order of appearance
};

// Replace every ${NAME} token whose NAME is in vars. Unknown tokens are kept
// verbatim and reported in `undefined`. Replacement values are not rescanned.
SubstitutionResult substitute(const std::string& text, const VariableMap& vars);

}
