#include "config/ConfigStore.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

using namespace sdbx::config;

namespace {

Value decodeValue(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::monostate{};

    if (node.IsSequence()) {
        std::vector<std::string> out;
        out.reserve(node.size());
        for (const auto& item : node) out.push_back(item.as<std::string>());
        return out;
    }

    if (!node.IsScalar()) throw std::runtime_error("Unsupported value type in state file");

    // Quoted scalars are always strings
    if (node.Tag() == "!") return node.as<std::string>();

    if (bool b; YAML::convert<bool>::decode(node, b)) return b;
    if (double d; YAML::convert<double>::decode(node, d)) return d;
    return node.as<std::string>();
}

struct ValueEmitter {
    YAML::Emitter& out;

    void operator()(std::monostate) const { out << YAML::Null; }
    void operator()(const bool b) const { out << b; }
    void operator()(const double d) const { out << d; }
    void operator()(const std::string& s) const { out << YAML::DoubleQuoted << s; }
    void operator()(const std::vector<std::string>& list) const {
        out << YAML::BeginSeq;
        for (const auto& s : list) out << YAML::DoubleQuoted << s;
        out << YAML::EndSeq;
    }
};

}

std::string ConfigStore::getString(const std::string& section, const std::string& key, const std::string& def) const {
    const auto v = get(section, key);
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    return def;
}

std::vector<std::string> ConfigStore::getStringList(const std::string& section, const std::string& key) const {
    const auto v = get(section, key);
    if (const auto* list = std::get_if<std::vector<std::string>>(&v)) return *list;
    return {};
}

std::optional<double> ConfigStore::getTimestamp(const std::string& section, const std::string& key) const {
    const auto v = get(section, key);
    if (const auto* d = std::get_if<double>(&v)) return *d;
    return std::nullopt;
}

MemoryConfigStore::MemoryConfigStore() {
    sections_["main"] = {
        {"path", std::string{}},
        {"excluded_folders", std::vector<std::string>{}}
    };
    sections_["internal"] = {
        {"cursor", std::string{}},
        {"lastsync", std::monostate{}}
    };
    sections_["account"] = {
        {"mail", std::string{}},
        {"type", std::string{}},
        {"display_name", std::string{}},
        {"access_token", std::string{}}
    };
}

Value MemoryConfigStore::get(const std::string& section, const std::string& key) const {
    std::scoped_lock lock(mutex_);
    const auto sec = sections_.find(section);
    if (sec == sections_.end()) return std::monostate{};
    const auto it = sec->second.find(key);
    if (it == sec->second.end()) return std::monostate{};
    return it->second;
}

void MemoryConfigStore::set(const std::string& section, const std::string& key, const Value& value) {
    std::scoped_lock lock(mutex_);
    sections_[section][key] = value;
    persist();
}

YamlConfigStore::YamlConfigStore(std::filesystem::path file)
    : file_(std::move(file)) {
    load();
}

void YamlConfigStore::load() {
    if (!std::filesystem::exists(file_)) {
        log::Registry::config()->info("[ConfigStore] No state file at {}, starting with defaults", file_.string());
        return;
    }

    const YAML::Node root = YAML::LoadFile(file_.string());
    if (!root.IsMap()) {
        log::Registry::config()->warn("[ConfigStore] State file {} is not a mapping, ignoring it", file_.string());
        return;
    }

    std::scoped_lock lock(mutex_);
    for (const auto& sec : root) {
        if (!sec.second.IsMap()) continue;
        auto& section = sections_[sec.first.as<std::string>()];
        for (const auto& kv : sec.second) section[kv.first.as<std::string>()] = decodeValue(kv.second);
    }

    log::Registry::config()->debug("[ConfigStore] Loaded state from {}", file_.string());
}

void YamlConfigStore::persist() {
    namespace fs = std::filesystem;

    YAML::Emitter out;
    out.SetDoublePrecision(17);
    out << YAML::BeginMap;
    for (const auto& [name, section] : sections_) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        for (const auto& [key, value] : section) {
            out << YAML::Key << key << YAML::Value;
            std::visit(ValueEmitter{out}, value);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    if (!out.good()) throw std::runtime_error("Failed to encode state file: " + out.GetLastError());

    if (file_.has_parent_path()) fs::create_directories(file_.parent_path());

    const auto tmp = fs::path(file_.string() + ".tmp");
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) throw std::runtime_error("Failed to write state file: " + tmp.string());
        f << out.c_str() << '\n';
        f.flush();
        if (!f) throw std::runtime_error("Failed to write state file: " + tmp.string());
    }
    fs::rename(tmp, file_);
}
