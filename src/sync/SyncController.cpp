#include "sync/SyncController.hpp"
#include "sync/ChangeMonitor.hpp"
#include "sync/guards.hpp"
#include "cloud/RemoteClient.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/ConfigStore.hpp"
#include "log/Registry.hpp"
#include "shell/Prompt.hpp"
#include "util/files.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <chrono>
#include <ostream>
#include <stdexcept>

using namespace sdbx::sync;
using namespace sdbx::util;
namespace fs = std::filesystem;

namespace {

double nowSeconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

bool contains(const std::vector<std::string>& folders, const std::string& path) {
    return std::ranges::any_of(folders, [&](const auto& f) { return normalizeRemotePath(f) == path; });
}

}

SyncController::SyncController(std::shared_ptr<config::ConfigStore> store,
                               std::shared_ptr<cloud::RemoteClient> client,
                               std::shared_ptr<ChangeMonitor> monitor,
                               std::shared_ptr<shell::Prompt> prompt,
                               const bool run)
    : store_(std::move(store)), client_(std::move(client)),
      monitor_(std::move(monitor)), prompt_(std::move(prompt)) {
    if (!store_ || !client_ || !monitor_ || !prompt_)
        throw std::invalid_argument("SyncController requires a store, a client, a monitor and a prompt");

    // hold off on syncing anything until bootstrap is done
    pausedByUser_ = true;
    monitor_->setStoppedByUser(true);

    firstSync_ = computeFirstSync();
    if (firstSync_) bootstrap();

    if (run) resumeSync();
}

bool SyncController::computeFirstSync() const {
    const auto lastSync = store_->getTimestamp("internal", "lastsync");
    const auto cursor = store_->getString("internal", "cursor");
    const auto path = store_->getString("main", "path");
    return !lastSync || cursor.empty() || path.empty() || !fs::is_directory(expandUser(path));
}

void SyncController::bootstrap() {
    log::Registry::sync()->info("[SyncController] No completed sync on record, running first-time setup");

    setDropboxDirectory();

    if (!selectExcludedFolders())
        log::Registry::sync()->warn("[SyncController] Could not list Dropbox folders, syncing everything");

    // a failed download must be retried from scratch on next launch
    store_->set("internal", "cursor", std::string{});
    store_->set("internal", "lastsync", std::monostate{});

    if (getRemoteDropbox()) log::Registry::sync()->info("[SyncController] First sync complete");
    else log::Registry::sync()->warn("[SyncController] First sync did not complete, it will be retried on next start");
}

// Downloads the full Dropbox, apart from excluded folders. Run on first sync.
bool SyncController::getRemoteDropbox() {
    return ifConnected(*this, [&] {
        const auto cursor = client_->downloadTree(excludedFolders());
        store_->set("internal", "cursor", cursor);
        store_->set("internal", "lastsync", nowSeconds());
        firstSync_ = false;
    });
}

bool SyncController::isSyncing() const { return monitor_->isRunning(); }

bool SyncController::isConnected() const { return monitor_->isConnected(); }

void SyncController::pauseSync() {
    pausedByUser_ = true;
    monitor_->setStoppedByUser(true);
    monitor_->stop();
    log::Registry::sync()->debug("[SyncController] Syncing paused");
}

void SyncController::resumeSync() {
    pausedByUser_ = false;
    monitor_->setStoppedByUser(false);
    monitor_->start();
    log::Registry::sync()->debug("[SyncController] Syncing resumed");
}

void SyncController::releaseSync() {
    pausedByUser_ = false;
    monitor_->setStoppedByUser(false);
    if (monitor_->isConnected()) monitor_->start();
    log::Registry::sync()->debug("[SyncController] Syncing released, connected: {}", monitor_->isConnected());
}

void SyncController::unlink() {
    pausedByUser_ = true;
    monitor_->setStoppedByUser(true);
    monitor_->stop();
    client_->unlink();
    log::Registry::sync()->info("[SyncController] Account unlinked, local files kept in {}",
                                getDropboxDirectory().string());
}

void SyncController::excludeFolder(const std::string& dbxPath) {
    withSyncPaused(*this, [&] {
        const auto path = normalizeRemotePath(dbxPath);
        if (path.empty()) throw std::invalid_argument("Cannot exclude the Dropbox root folder");

        auto folders = excludedFolders();
        if (!contains(folders, path)) {
            folders.push_back(path);
            storeExcludedFolders(folders);
            log::Registry::sync()->info("[SyncController] Excluded {}", path);
        }

        if (const auto local = client_->toLocalPath(path); fs::is_directory(local)) removePath(local);

        client_->setLocalRevisionMarker(path, std::nullopt);
    });
}

bool SyncController::includeFolder(const std::string& dbxPath) {
    return withSyncPaused(*this, [&] {
        return ifConnected(*this, [&] {
            const auto path = normalizeRemotePath(dbxPath);

            auto folders = excludedFolders();
            if (!contains(folders, path)) {
                log::Registry::sync()->debug("[SyncController] {} is already included, nothing to do", path);
                return;
            }

            try {
                client_->downloadFolder(path);
            } catch (const cloud::ConnectionError&) {
                // keep the folder excluded and drop whatever arrived
                removePath(client_->toLocalPath(path));
                client_->setLocalRevisionMarker(path, std::nullopt);
                throw;
            }

            std::erase_if(folders, [&](const auto& f) { return normalizeRemotePath(f) == path; });
            storeExcludedFolders(folders);
            log::Registry::sync()->info("[SyncController] Included {}", path);
        });
    });
}

bool SyncController::selectExcludedFolders() {
    return ifConnected(*this, [&] {
        const auto oldFolders = excludedFolders();
        std::vector<std::string> newFolders;

        for (const auto& entry : client_->listTopLevelFolders()) {
            if (!entry.is_folder) continue;
            if (prompt_->yesno("Exclude '" + entry.path_display + "' from sync?", false)) {
                const auto path = normalizeRemotePath(entry.path_lower);
                if (!contains(newFolders, path)) newFolders.push_back(path);
            }
        }

        std::vector<std::string> removed;
        for (const auto& f : oldFolders) {
            const auto path = normalizeRemotePath(f);
            if (!contains(newFolders, path)) removed.push_back(path);
        }

        auto persisted = newFolders;

        // nothing is downloaded yet on first sync, so there is nothing to apply
        if (!firstSync_) {
            for (const auto& folder : newFolders) excludeFolder(folder);

            for (const auto& folder : removed)
                if (!includeFolder(folder)) persisted.push_back(folder);
        }

        storeExcludedFolders(persisted);
        log::Registry::sync()->info("[SyncController] {} folder(s) excluded from sync", persisted.size());
    });
}

void SyncController::setDropboxDirectory(const std::optional<fs::path>& newPath) {
    withSyncPaused(*this, [&] {
        const auto stored = store_->getString("main", "path");
        const auto oldPath = stored.empty() ? fs::path{} : fs::absolute(expandUser(stored)).lexically_normal();

        fs::path target;
        if (newPath) target = fs::absolute(expandUser(newPath->string())).lexically_normal();
        else target = prompt_->askForPath(stored.empty() ? config::ConfigRegistry::get().sync.default_path : stored);

        if (!oldPath.empty() && isSameEntity(oldPath, target)) {
            log::Registry::sync()->debug("[SyncController] {} is already the Dropbox folder", target.string());
            return;
        }

        if (!oldPath.empty() && fs::is_directory(oldPath)) {
            if (isSameOrBelow(oldPath.generic_string(), target.generic_string()) ||
                isSameOrBelow(target.generic_string(), oldPath.generic_string()))
                throw std::invalid_argument("Cannot move Dropbox folder " + oldPath.string() + " to " + target.string());

            if (fs::exists(fs::symlink_status(target))) removePath(target);
            movePath(oldPath, target);
        } else {
            if (fs::exists(fs::symlink_status(target)) && !fs::is_directory(fs::symlink_status(target)))
                removePath(target);
            fs::create_directories(target);
        }

        client_->setLocalRoot(target);
        store_->set("main", "path", target.string());
        log::Registry::sync()->info("[SyncController] Dropbox folder is now {}", target.string());
    });
}

fs::path SyncController::getDropboxDirectory() const {
    return client_->localRoot();
}

bool SyncController::refreshAccountInfo() {
    return ifConnected(*this, [&] {
        const auto info = client_->accountInfo();
        store_->set("account", "mail", info.email);
        store_->set("account", "type", info.account_type);
        store_->set("account", "display_name", info.display_name);
    });
}

std::string SyncController::describe() const {
    if (!isConnected()) return "SisyphosDBX(Connecting...)";
    return "SisyphosDBX(" + store_->getString("account", "mail") + ", " + store_->getString("account", "type") + ")";
}

void SyncController::reportConnectionError() const {
    prompt_->print(CONNECTION_ERROR_MSG);
}

std::vector<std::string> SyncController::excludedFolders() const {
    return store_->getStringList("main", "excluded_folders");
}

void SyncController::storeExcludedFolders(const std::vector<std::string>& folders) {
    std::vector<std::string> out;
    out.reserve(folders.size());
    for (const auto& f : folders) {
        const auto path = normalizeRemotePath(f);
        if (!path.empty() && !contains(out, path)) out.push_back(path);
    }
    store_->set("main", "excluded_folders", out);
}

std::ostream& sdbx::sync::operator<<(std::ostream& os, const SyncController& controller) {
    return os << controller.describe();
}
