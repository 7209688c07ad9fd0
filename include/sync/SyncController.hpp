#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sdbx::cloud { class RemoteClient; }
namespace sdbx::config { class ConfigStore; }
namespace sdbx::shell { class Prompt; }

namespace sdbx::sync {

class ChangeMonitor;

// Owns the sync lifecycle of one linked account: start/pause/resume/unlink,
// first-sync bootstrap, top-level folder exclusion and relocation of the local
// Dropbox folder.
//
// Operations that delete or move local files run with the monitor paused.
// Operations that need the network fail cleanly (return false, print one
// message) instead of throwing when Dropbox cannot be reached.
class SyncController {
public:
    // Runs the interactive bootstrap when no successful sync is recorded.
    // With run == false the monitor is left paused.
    SyncController(std::shared_ptr<config::ConfigStore> store,
                   std::shared_ptr<cloud::RemoteClient> client,
                   std::shared_ptr<ChangeMonitor> monitor,
                   std::shared_ptr<shell::Prompt> prompt,
                   bool run = true);

    [[nodiscard]] bool isSyncing() const;
    [[nodiscard]] bool isConnected() const;
    [[nodiscard]] bool isFirstSync() const { return firstSync_; }
    [[nodiscard]] bool isPausedByUser() const { return pausedByUser_; }

    void pauseSync();
    void resumeSync();

    // Lifts a pause without forcing syncing back on. The monitor restarts only
    // if the connection is up; otherwise it restarts on reconnect.
    void releaseSync();

    // Stops syncing and drops the account link. Local files stay in place.
    void unlink();

    // Safe to call for folders which are already excluded.
    void excludeFolder(const std::string& dbxPath);

    // Safe to call for folders which are already included; they are not downloaded again.
    bool includeFolder(const std::string& dbxPath);

    // Asks for every top-level folder whether it should be excluded.
    bool selectExcludedFolders();

    // Moves the local Dropbox folder. Prompts for the location when newPath is empty.
    // Anything already at newPath is overwritten.
    void setDropboxDirectory(const std::optional<std::filesystem::path>& newPath = std::nullopt);

    [[nodiscard]] std::filesystem::path getDropboxDirectory() const;

    bool refreshAccountInfo();

    [[nodiscard]] std::string describe() const;

    // Used by ifConnected().
    void reportConnectionError() const;

private:
    std::shared_ptr<config::ConfigStore> store_;
    std::shared_ptr<cloud::RemoteClient> client_;
    std::shared_ptr<ChangeMonitor> monitor_;
    std::shared_ptr<shell::Prompt> prompt_;

    bool firstSync_ = false;
    bool pausedByUser_ = false;

    [[nodiscard]] bool computeFirstSync() const;

    void bootstrap();
    bool getRemoteDropbox();

    [[nodiscard]] std::vector<std::string> excludedFolders() const;
    void storeExcludedFolders(const std::vector<std::string>& folders);
};

std::ostream& operator<<(std::ostream& os, const SyncController& controller);

}
