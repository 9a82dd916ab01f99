#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

void StringUtils::strip_chars(std::string& str, const std::string& chars) {
    size_t first = str.find_first_not_of(chars);
    if (first == std::string::npos) {
        str.clear();
        return;
    }
    size_t last = str.find_last_not_of(chars);
    str = str.substr(first, last - first + 1);
}

std::vector<std::string> StringUtils::split_shell_words(const std::string& str) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;

    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\\') {
            if (i + 1 < str.size()) {
                current += str[++i];
            }
        } else if (c == '\'') {
            size_t close = str.find('\'', i + 1);
            if (close == std::string::npos) {
                throw std::invalid_argument("Unterminated single quote in: " + str);
            }
            current.append(str, i + 1, close - i - 1);
            i = close;
        } else if (c == '"') {
            size_t j = i + 1;
            for (; j < str.size() && str[j] != '"'; ++j) {
                if (str[j] == '\\' && j + 1 < str.size() &&
                    std::string("\\\"$`").find(str[j + 1]) != std::string::npos) {
                    ++j;
                }
                current += str[j];
            }
            if (j >= str.size()) {
                throw std::invalid_argument("Unterminated double quote in: " + str);
            }
            i = j;
        } else {
            current += c;
        }
    }

    if (in_word) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

// Non-overlapping, left to right
void StringUtils::replace_all(std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return;

    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.length(), to);
        pos += to.length();
    }
}
