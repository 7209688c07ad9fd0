#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sdbx::cloud {

struct FolderEntry {
    std::string path_display;
    std::string path_lower;
    bool is_folder = false;
};

// Outcome of a long-poll. backoff is how long the server wants the client to
// wait before polling again.
struct PollResult {
    bool changes = false;
    std::chrono::seconds backoff{0};
};

struct AccountInfo {
    std::string account_id;
    std::string email;
    std::string display_name;
    std::string account_type;
};

// Authenticated access to the remote account. Network calls throw
// ConnectionError on transport failure and ApiError when the server refuses.
class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    // Non-recursive listing of the account root, folders and files alike.
    [[nodiscard]] virtual std::vector<FolderEntry> listTopLevelFolders() = 0;

    // Downloads the whole account except excludedFolders into localRoot().
    // Returns the listing cursor the download corresponds to.
    virtual std::string downloadTree(const std::vector<std::string>& excludedFolders) = 0;

    virtual void downloadFolder(const std::string& path) = 0;

    // std::nullopt clears the marker for path and everything below it.
    virtual void setLocalRevisionMarker(const std::string& path, const std::optional<std::string>& rev) = 0;

    // Revokes the access token and forgets stored credentials.
    virtual void unlink() = 0;

    [[nodiscard]] virtual std::filesystem::path localRoot() const = 0;
    virtual void setLocalRoot(const std::filesystem::path& root) = 0;

    [[nodiscard]] virtual std::filesystem::path toLocalPath(const std::string& remotePath) const = 0;

    // Never throws; false when the servers cannot be reached.
    [[nodiscard]] virtual bool checkConnection() = 0;

    [[nodiscard]] virtual AccountInfo accountInfo() = 0;

    // Blocks until the remote changes after cursor or timeout expires. changes
    // is false on timeout or when interrupt becomes true.
    virtual PollResult waitForChanges(const std::string& cursor, std::chrono::seconds timeout,
                                const std::atomic<bool>& interrupt) = 0;

    // Applies remote changes since cursor to the local folder, skipping
    // excludedFolders. Returns the new cursor.
    virtual std::string applyChanges(const std::string& cursor, const std::vector<std::string>& excludedFolders) = 0;
};

}
