#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace tooldock::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

// "~" and "~/..." resolve against $HOME; anything else is returned unchanged.
inline std::filesystem::path ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath();
    }
    if (path.rfind("~/", 0) == 0) {
        return GetHomePath() / path.substr(2);
    }
    return std::filesystem::path(path);
}

}  // namespace tooldock::utils
