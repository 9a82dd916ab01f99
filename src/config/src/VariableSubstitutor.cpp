#include "VariableSubstitutor.hpp"

namespace VariableSubstitutor {

SubstitutionResult substitute(const std::string& text, const VariableMap& vars) {
    SubstitutionResult result;
    result.text.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find("${", pos);
        if (start == std::string::npos) {
            result.text.append(text, pos, std::string::npos);
            break;
        }

        size_t end = text.find('}', start + 2);
        if (end == std::string::npos) {
            result.text.append(text, pos, std::string::npos);
            break;
        }

        result.text.append(text, pos, start - pos);

        // "${}" has no name: emit the '$' and keep scanning after it
        if (end == start + 2) {
            result.text.push_back('$');
            pos = start + 1;
            continue;
        }

        std::string name = text.substr(start + 2, end - start - 2);
        auto it = vars.find(name);
        if (it != vars.end()) {
            result.text += it->second;
        } else {
            result.text.append(text, start, end - start + 1);
            result.undefined.push_back(name);
        }
        pos = end + 1;
    }

    return result;
}

}
