#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

namespace sdbx::paths {

inline bool testMode = false;

inline std::filesystem::path testLogPath;

inline std::filesystem::path getHomePath() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    return "/tmp";
}

inline std::filesystem::path getConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "sisyphosdbx";
    return getHomePath() / ".config" / "sisyphosdbx";
}

inline std::filesystem::path getConfigPath() { return getConfigDir() / "config.yaml"; }

inline std::filesystem::path getStatePath() { return getConfigDir() / "state.yaml"; }

inline std::filesystem::path getLogPath() {
    if (testMode) return testLogPath;
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "sisyphosdbx";
    return getHomePath() / ".local" / "state" / "sisyphosdbx";
}

inline void setLogPathForTesting() {
    testMode = true;
    testLogPath = std::filesystem::temp_directory_path() / "sisyphosdbx_test_logs";
}

}
