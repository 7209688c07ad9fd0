#pragma once

#include "cloud/RemoteClient.hpp"
#include "cloud/RevisionStore.hpp"
#include "config/Config.hpp"

#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>

namespace sdbx::config { class ConfigStore; }

namespace sdbx::cloud {

// RemoteClient for the Dropbox HTTP API v2. The OAuth2 access token and the
// sync root are read from the "account" and "main" sections of the store.
class DropboxClient final : public RemoteClient {
public:
    DropboxClient(std::shared_ptr<config::ConfigStore> store, config::DropboxConfig cfg);

    ~DropboxClient() override = default;

    // #########################################################################
    // ############################ RemoteClient ###############################
    // #########################################################################

    [[nodiscard]] std::vector<FolderEntry> listTopLevelFolders() override;
    std::string downloadTree(const std::vector<std::string>& excludedFolders) override;
    void downloadFolder(const std::string& path) override;
    void setLocalRevisionMarker(const std::string& path, const std::optional<std::string>& rev) override;
    void unlink() override;

    [[nodiscard]] std::filesystem::path localRoot() const override;
    void setLocalRoot(const std::filesystem::path& root) override;
    [[nodiscard]] std::filesystem::path toLocalPath(const std::string& remotePath) const override;

    [[nodiscard]] bool checkConnection() override;
    [[nodiscard]] AccountInfo accountInfo() override;

    PollResult waitForChanges(const std::string& cursor, std::chrono::seconds timeout,
                        const std::atomic<bool>& interrupt) override;
    std::string applyChanges(const std::string& cursor, const std::vector<std::string>& excludedFolders) override;

    // #########################################################################
    // ############################## Helpers ##################################
    // #########################################################################

    [[nodiscard]] std::string latestCursor(const std::string& path = "", bool recursive = true);

private:
    struct Listing {
        std::vector<nlohmann::json> entries;
        std::string cursor;
    };

    std::shared_ptr<config::ConfigStore> store_;
    config::DropboxConfig cfg_;

    mutable std::mutex rootMutex_;
    std::filesystem::path root_;
    std::unique_ptr<RevisionStore> revs_;

    [[nodiscard]] std::string accessToken() const;

    nlohmann::json rpc(const std::string& endpoint, const nlohmann::json& args) const;

    Listing listFolder(const std::string& path, bool recursive) const;
    Listing listFolderContinue(const std::string& cursor) const;

    void downloadFile(const std::string& remotePath, const std::string& rev);

    // Applies a batch of list_folder entries below the local root.
    void applyEntries(const std::vector<nlohmann::json>& entries, const std::vector<std::string>& excludedFolders);

    [[noreturn]] static void throwForResponse(const std::string& what, long http, int curlCode,
                                              const std::string& curlError, const std::string& body,
                                              long retryAfter = 0);
};

}
