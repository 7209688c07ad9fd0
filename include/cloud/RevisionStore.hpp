#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sdbx::cloud {

// Last synced Dropbox revision of every local item, keyed by lower-case remote
// path. Persisted as a JSON object in <sync root>/.dropbox.
class RevisionStore {
public:
    static constexpr auto FILE_NAME = ".dropbox";

    // An empty file leaves the store unbound: nothing is loaded or written
    // until relocate() names a file.
    explicit RevisionStore(std::filesystem::path file);

    [[nodiscard]] std::optional<std::string> get(const std::string& path) const;

    // std::nullopt removes path and all entries below it.
    void set(const std::string& path, const std::optional<std::string>& rev);

    void clear();

    // Points the store at a new file. The in-memory map is kept and written there.
    void relocate(const std::filesystem::path& file);

    [[nodiscard]] std::filesystem::path file() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::filesystem::path file_;
    std::unordered_map<std::string, std::string> revs_;

    void load();
    void save() const;
};

}
