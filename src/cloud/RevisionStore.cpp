#include "cloud/RevisionStore.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace sdbx::cloud;
namespace fs = std::filesystem;

RevisionStore::RevisionStore(fs::path file)
    : file_(std::move(file)) {
    load();
}

void RevisionStore::load() {
    std::scoped_lock lock(mutex_);
    revs_.clear();

    if (file_.empty() || !fs::exists(file_)) return;

    std::ifstream in(file_);
    if (!in.is_open()) {
        log::Registry::cloud()->warn("[RevisionStore] Cannot open {}, starting empty", file_.string());
        return;
    }

    const auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        log::Registry::cloud()->warn("[RevisionStore] {} is corrupt, starting empty", file_.string());
        return;
    }

    for (const auto& [path, rev] : j.items())
        if (rev.is_string()) revs_[path] = rev.get<std::string>();

    log::Registry::cloud()->debug("[RevisionStore] Loaded {} revisions from {}", revs_.size(), file_.string());
}

void RevisionStore::save() const {
    if (file_.empty()) return;

    nlohmann::json j = nlohmann::json::object();
    for (const auto& [path, rev] : revs_) j[path] = rev;

    if (file_.has_parent_path()) fs::create_directories(file_.parent_path());

    std::ofstream out(file_, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to write revision file: " + file_.string());
    out << j.dump(2);
}

std::optional<std::string> RevisionStore::get(const std::string& path) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = revs_.find(util::normalizeRemotePath(path)); it != revs_.end()) return it->second;
    return std::nullopt;
}

void RevisionStore::set(const std::string& path, const std::optional<std::string>& rev) {
    const auto key = util::normalizeRemotePath(path);

    std::scoped_lock lock(mutex_);
    if (rev) revs_[key] = *rev;
    else std::erase_if(revs_, [&](const auto& kv) { return util::isSameOrBelow(kv.first, key); });
    save();
}

void RevisionStore::clear() {
    std::scoped_lock lock(mutex_);
    revs_.clear();
    save();
}

void RevisionStore::relocate(const fs::path& file) {
    std::scoped_lock lock(mutex_);
    file_ = file;
    save();
}

fs::path RevisionStore::file() const {
    std::scoped_lock lock(mutex_);
    return file_;
}

size_t RevisionStore::size() const {
    std::scoped_lock lock(mutex_);
    return revs_.size();
}
