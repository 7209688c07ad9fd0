#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <paths.hpp>
#include <yaml-cpp/yaml.h>

namespace sdbx::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    cfg.sync.state_file = paths::getStatePath();

    if (!std::filesystem::exists(path)) return cfg;

    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["dropbox"]) YAML::convert<DropboxConfig>::decode(node, cfg.dropbox);
    if (auto node = root["monitor"]) YAML::convert<MonitorConfig>::decode(node, cfg.monitor);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);

    if (cfg.sync.state_file.empty()) cfg.sync.state_file = paths::getStatePath();

    return cfg;
}

}
