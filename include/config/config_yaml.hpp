#pragma once

#include "config/Config.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sdbx::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["sisyphos"]   = to_std_string(spdlog::level::to_string_view(rhs.sisyphos));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["cloud"]      = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["filesystem"] = to_std_string(spdlog::level::to_string_view(rhs.filesystem));
        node["config"]     = to_std_string(spdlog::level::to_string_view(rhs.config));
        node["shell"]      = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.sisyphos = spdlog::level::from_str(node["sisyphos"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.filesystem = spdlog::level::from_str(node["filesystem"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<DropboxConfig> {
    static Node encode(const DropboxConfig& rhs) {
        Node node;
        node["api_endpoint"] = rhs.api_endpoint;
        node["content_endpoint"] = rhs.content_endpoint;
        node["notify_endpoint"] = rhs.notify_endpoint;
        node["request_timeout_seconds"] = rhs.request_timeout.count();
        return node;
    }

    static bool decode(const Node& node, DropboxConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.api_endpoint = node["api_endpoint"].as<std::string>("https://api.dropboxapi.com/2");
        rhs.content_endpoint = node["content_endpoint"].as<std::string>("https://content.dropboxapi.com/2");
        rhs.notify_endpoint = node["notify_endpoint"].as<std::string>("https://notify.dropboxapi.com/2");
        rhs.request_timeout = std::chrono::seconds(node["request_timeout_seconds"].as<long>(60));
        return true;
    }
};

template<>
struct convert<MonitorConfig> {
    static Node encode(const MonitorConfig& rhs) {
        Node node;
        node["connection_check_interval_seconds"] = rhs.connection_check_interval.count();
        node["longpoll_timeout_seconds"] = rhs.longpoll_timeout.count();
        node["retry_backoff_seconds"] = rhs.retry_backoff.count();
        return node;
    }

    static bool decode(const Node& node, MonitorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.connection_check_interval = std::chrono::seconds(node["connection_check_interval_seconds"].as<long>(5));
        // Dropbox accepts 30..480 seconds for list_folder/longpoll
        rhs.longpoll_timeout = std::chrono::seconds(std::clamp(node["longpoll_timeout_seconds"].as<long>(30), 30L, 480L));
        rhs.retry_backoff = std::chrono::seconds(node["retry_backoff_seconds"].as<long>(10));
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["default_path"] = rhs.default_path;
        node["state_file"] = rhs.state_file.string();
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_path = node["default_path"].as<std::string>("~/Dropbox");
        if (node["state_file"]) rhs.state_file = sdbx::util::expandUser(node["state_file"].as<std::string>());
        return true;
    }
};

}
