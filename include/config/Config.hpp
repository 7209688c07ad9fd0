#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace sdbx::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum sisyphos   = spdlog::level::info;   // Startup, shutdown, CLI command outcomes
    spdlog::level::level_enum sync       = spdlog::level::info;   // Pause/resume, bootstrap, exclusion changes
    spdlog::level::level_enum cloud      = spdlog::level::warn;   // Dropbox API errors, lost connections
    spdlog::level::level_enum filesystem = spdlog::level::info;   // Moves and deletions inside the sync root
    spdlog::level::level_enum config     = spdlog::level::warn;   // State file load/save problems
    spdlog::level::level_enum shell      = spdlog::level::warn;   // Prompt edge cases
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct DropboxConfig {
    std::string api_endpoint = "https://api.dropboxapi.com/2";
    std::string content_endpoint = "https://content.dropboxapi.com/2";
    std::string notify_endpoint = "https://notify.dropboxapi.com/2";
    std::chrono::seconds request_timeout = std::chrono::seconds(60);
};

struct MonitorConfig {
    std::chrono::seconds connection_check_interval = std::chrono::seconds(5);
    std::chrono::seconds longpoll_timeout = std::chrono::seconds(30);
    std::chrono::seconds retry_backoff = std::chrono::seconds(10);
};

struct SyncConfig {
    std::string default_path = "~/Dropbox";
    std::filesystem::path state_file;
};

struct Config {
    LoggingConfig logging;
    DropboxConfig dropbox;
    MonitorConfig monitor;
    SyncConfig sync;
};

// Missing file yields defaults; a malformed file throws YAML::Exception.
Config loadConfig(const std::filesystem::path& path);

}
