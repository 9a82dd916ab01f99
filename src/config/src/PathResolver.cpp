#include "PathResolver.hpp"
#include "StringUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <vector>
#include <pwd.h>
#include <unistd.h>

namespace PathResolver {

namespace {

std::string absolutize(const std::string& path) {
    std::filesystem::path p(path);

    if (p.is_relative()) {
        std::error_code ec;
        std::filesystem::path cwd = std::filesystem::current_path(ec);
        if (ec) {
            return path;
        }
        p = cwd / p;
    }

    std::string result = p.lexically_normal().string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

}

bool is_remote(const std::string& path) {
    return path.find(':') != std::string::npos;
}

std::string home_directory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }

    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(size > 0 ? static_cast<size_t>(size) : 16384);
    passwd pwd;
    passwd* entry = nullptr;
    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &entry) == 0 && entry != nullptr) {
        return entry->pw_dir;
    }
    return {};
}

std::string normalize(const std::string& path) {
    std::string expanded = path;

    if (expanded.rfind("~/", 0) == 0) {
        std::string home = home_directory();
        if (!home.empty()) {
            while (home.size() > 1 && home.back() == '/') {
                home.pop_back();
            }
            if (home == "/") home.clear();
            expanded = home + expanded.substr(1);
        }
    } else if (!expanded.empty() && expanded[0] == '/') {
        while (expanded.find("/~/") != std::string::npos) {
            StringUtils::replace_all(expanded, "/~/", "/");
        }
    }

    return absolutize(expanded);
}

}
