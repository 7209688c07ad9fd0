#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

#include <paths.hpp>

namespace sdbx::util {

namespace fs = std::filesystem;

inline std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Dropbox paths are case-insensitive: "/Photos/2024/" -> "/photos/2024". Root is "".
inline std::string normalizeRemotePath(const std::string& path) {
    if (path.empty() || path == "/") return "";
    auto norm = fs::path("/" + toLower(path)).lexically_normal().generic_string();
    while (norm.size() > 1 && norm.back() == '/') norm.pop_back();
    if (norm == "/") return "";
    return norm;
}

// True if path equals folder or lies below it. Both must already be normalized.
inline bool isSameOrBelow(const std::string& path, const std::string& folder) {
    if (folder.empty()) return true;
    if (path.size() < folder.size()) return false;
    if (path.compare(0, folder.size(), folder) != 0) return false;
    return path.size() == folder.size() || path[folder.size()] == '/';
}

inline bool isExcluded(const std::string& path, const std::vector<std::string>& excludedFolders) {
    const auto norm = normalizeRemotePath(path);
    return std::ranges::any_of(excludedFolders, [&](const std::string& f) {
        return isSameOrBelow(norm, normalizeRemotePath(f));
    });
}

inline fs::path expandUser(const std::string& path) {
    if (path.empty() || path.front() != '~') return path;
    if (path.size() == 1) return paths::getHomePath();
    if (path[1] == '/') return paths::getHomePath() / path.substr(2);
    return path;
}

inline fs::path stripLeadingSlash(const std::string& path) {
    auto p = path;
    while (!p.empty() && p.front() == '/') p.erase(0, 1);
    return p;
}

}
