#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sdbx::config {

// std::monostate is the "unset" value, e.g. internal.lastsync before the first sync.
using Value = std::variant<std::monostate, bool, double, std::string, std::vector<std::string>>;

using Section = std::map<std::string, Value>;

// Persisted section -> key -> value mapping. Sections used: "main", "internal", "account".
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    [[nodiscard]] virtual Value get(const std::string& section, const std::string& key) const = 0;

    // Durable on return.
    virtual void set(const std::string& section, const std::string& key, const Value& value) = 0;

    [[nodiscard]] std::string getString(const std::string& section, const std::string& key,
                                        const std::string& def = "") const;

    [[nodiscard]] std::vector<std::string> getStringList(const std::string& section, const std::string& key) const;

    [[nodiscard]] std::optional<double> getTimestamp(const std::string& section, const std::string& key) const;
};

class MemoryConfigStore : public ConfigStore {
public:
    MemoryConfigStore();

    [[nodiscard]] Value get(const std::string& section, const std::string& key) const override;

    void set(const std::string& section, const std::string& key, const Value& value) override;

protected:
    mutable std::mutex mutex_;
    std::map<std::string, Section> sections_;

    // Called with mutex_ held after every mutation.
    virtual void persist() {}
};

// Same semantics as MemoryConfigStore; the whole document is rewritten on every set().
class YamlConfigStore final : public MemoryConfigStore {
public:
    explicit YamlConfigStore(std::filesystem::path file);

    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

protected:
    void persist() override;

private:
    std::filesystem::path file_;

    void load();
};

}
