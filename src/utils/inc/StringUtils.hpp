#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>


class StringUtils {
public:
    static void trim(std::string& str);
    static void strip_chars(std::string& str, const std::string& chars);
    // Shell-style word splitting: whitespace separates words, '...' is literal,
    // "..." honours \\ \" \$ and \` escapes, and a bare backslash escapes the next
    // character. Throws std::invalid_argument on an unterminated quote.
    static std::vector<std::string> split_shell_words(const std::string& str);
    static std::string join(const std::vector<std::string>& parts, const std::string& sep);
    static void replace_all(std::string& str, const std::string& from, const std::string& to);
};
