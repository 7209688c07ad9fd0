#include "cloud/DropboxClient.hpp"
#include "cloud/errors.hpp"
#include "config/ConfigStore.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"
#include "util/files.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace sdbx::cloud;
using namespace sdbx::util;
using json = nlohmann::json;
namespace fs = std::filesystem;

static constexpr auto TOKEN_ENV_VAR = "SISYPHOSDBX_ACCESS_TOKEN";

// Dropbox adds up to 90 seconds of jitter to list_folder/longpoll
static constexpr auto LONGPOLL_JITTER = std::chrono::seconds(90);

DropboxClient::DropboxClient(std::shared_ptr<config::ConfigStore> store, config::DropboxConfig cfg)
    : store_(std::move(store)), cfg_(std::move(cfg)) {
    if (!store_) throw std::invalid_argument("DropboxClient requires a config store");
    ensureCurlGlobalInit();

    // no local folder yet on a fresh install
    if (const auto stored = store_->getString("main", "path"); !stored.empty()) root_ = expandUser(stored);
    revs_ = std::make_unique<RevisionStore>(root_.empty() ? fs::path{} : root_ / RevisionStore::FILE_NAME);
}

// -------------------------------------------------------------------------
// transport
// -------------------------------------------------------------------------

std::string DropboxClient::accessToken() const {
    if (auto token = store_->getString("account", "access_token"); !token.empty()) return token;
    if (const char* env = std::getenv(TOKEN_ENV_VAR); env && *env) return env;
    throw ApiError(401, "missing_access_token",
                   std::string("No Dropbox access token configured (account.access_token or ") + TOKEN_ENV_VAR + ")");
}

void DropboxClient::throwForResponse(const std::string& what, const long http, const int curlCode,
                                     const std::string& curlError, const std::string& body,
                                     const long retryAfter) {
    if (curlCode != CURLE_OK) {
        log::Registry::cloud()->warn("[DropboxClient] {} failed: {}", what, curlError);
        throw ConnectionError(what + ": " + curlError);
    }

    if (http == 429 || http >= 500) {
        auto msg = what + ": HTTP " + std::to_string(http);
        if (retryAfter > 0) msg += " (retry after " + std::to_string(retryAfter) + "s)";
        log::Registry::cloud()->warn("[DropboxClient] {}", msg);
        throw ConnectionError(msg);
    }

    std::string summary = body;
    if (const auto j = json::parse(body, nullptr, false); !j.is_discarded() && j.is_object())
        summary = j.value("error_summary", body);

    log::Registry::cloud()->error("[DropboxClient] {} rejected (HTTP {}): {}", what, http, summary);
    throw ApiError(http, summary, what + " rejected (HTTP " + std::to_string(http) + "): " + summary);
}

json DropboxClient::rpc(const std::string& endpoint, const json& args) const {
    const auto url = cfg_.api_endpoint + endpoint;
    const auto payload = args.dump();

    SList hdrs;
    hdrs.add("Authorization: Bearer " + accessToken());
    hdrs.add("Content-Type: application/json");

    log::Registry::cloud()->debug("[DropboxClient] POST {}", endpoint);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.request_timeout.count()));
    });

    if (!resp.ok()) throwForResponse(endpoint, resp.http, resp.curl, curl_easy_strerror(resp.curl), resp.body, resp.retryAfter);

    if (resp.body.empty() || resp.body == "null") return nullptr;
    return json::parse(resp.body);
}

// -------------------------------------------------------------------------
// listing
// -------------------------------------------------------------------------

DropboxClient::Listing DropboxClient::listFolder(const std::string& path, const bool recursive) const {
    const json args = {
        {"path", normalizeRemotePath(path)},
        {"recursive", recursive},
        {"include_deleted", false}
    };

    auto res = rpc("/files/list_folder", args);

    Listing listing;
    for (auto& e : res.at("entries")) listing.entries.push_back(std::move(e));
    listing.cursor = res.at("cursor").get<std::string>();

    if (res.value("has_more", false)) {
        auto rest = listFolderContinue(listing.cursor);
        std::ranges::move(rest.entries, std::back_inserter(listing.entries));
        listing.cursor = std::move(rest.cursor);
    }

    return listing;
}

DropboxClient::Listing DropboxClient::listFolderContinue(const std::string& cursor) const {
    Listing listing;
    listing.cursor = cursor;

    bool hasMore = true;
    while (hasMore) {
        auto res = rpc("/files/list_folder/continue", {{"cursor", listing.cursor}});
        for (auto& e : res.at("entries")) listing.entries.push_back(std::move(e));
        listing.cursor = res.at("cursor").get<std::string>();
        hasMore = res.value("has_more", false);
    }

    return listing;
}

std::vector<FolderEntry> DropboxClient::listTopLevelFolders() {
    const auto listing = listFolder("", false);

    std::vector<FolderEntry> out;
    out.reserve(listing.entries.size());
    for (const auto& e : listing.entries) {
        out.push_back({
            .path_display = e.value("path_display", ""),
            .path_lower = e.value("path_lower", ""),
            .is_folder = e.value(".tag", "") == "folder"
        });
    }

    log::Registry::cloud()->debug("[DropboxClient] {} top-level entries", out.size());
    return out;
}

std::string DropboxClient::latestCursor(const std::string& path, const bool recursive) {
    const json args = {
        {"path", normalizeRemotePath(path)},
        {"recursive", recursive},
        {"include_deleted", true}
    };
    return rpc("/files/list_folder/get_latest_cursor", args).at("cursor").get<std::string>();
}

// -------------------------------------------------------------------------
// download
// -------------------------------------------------------------------------

void DropboxClient::downloadFile(const std::string& remotePath, const std::string& rev) {
    const auto dest = toLocalPath(remotePath);
    const auto tmp = fs::path(dest.string() + ".sdbx-download");
    if (dest.has_parent_path()) fs::create_directories(dest.parent_path());

    const auto url = cfg_.content_endpoint + "/files/download";
    const json arg = {{"path", remotePath}};

    SList hdrs;
    hdrs.add("Authorization: Bearer " + accessToken());
    // Header values must be ASCII
    hdrs.add("Dropbox-API-Arg: " + arg.dump(-1, ' ', true));
    hdrs.add("Content-Type:");

    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to open " + tmp.string() + " for writing");

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, 0L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(cfg_.request_timeout.count()));
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud) -> size_t {
            auto* f = static_cast<std::ofstream*>(ud);
            f->write(p, static_cast<std::streamsize>(s * n));
            return *f ? s * n : 0;
        });
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &out);
    });
    out.close();

    if (!resp.ok()) {
        // Error responses carry a JSON body, which went to the temp file
        std::ifstream in(tmp);
        std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        in.close();
        fs::remove(tmp);
        throwForResponse("download " + remotePath, resp.http, resp.curl, curl_easy_strerror(resp.curl), body, resp.retryAfter);
    }

    fs::rename(tmp, dest);
    revs_->set(remotePath, rev);
    log::Registry::cloud()->debug("[DropboxClient] Downloaded {} (rev {})", remotePath, rev);
}

void DropboxClient::applyEntries(const std::vector<json>& entries, const std::vector<std::string>& excludedFolders) {
    unsigned int downloaded = 0, removed = 0;

    for (const auto& e : entries) {
        const auto tag = e.value(".tag", "");
        const auto pathLower = e.value("path_lower", "");
        const auto pathDisplay = e.value("path_display", pathLower);

        if (pathLower.empty() || isExcluded(pathLower, excludedFolders)) continue;

        const auto local = toLocalPath(pathDisplay);

        if (tag == "folder") {
            fs::create_directories(local);
            revs_->set(pathLower, "folder");
        } else if (tag == "file") {
            const auto rev = e.value("rev", "");
            if (fs::exists(local) && revs_->get(pathLower) == rev) continue;
            downloadFile(pathDisplay, rev);
            ++downloaded;
        } else if (tag == "deleted") {
            if (removePath(local) > 0) ++removed;
            revs_->set(pathLower, std::nullopt);
        }
    }

    log::Registry::cloud()->info("[DropboxClient] Applied {} entries: {} downloaded, {} removed",
                                 entries.size(), downloaded, removed);
}

std::string DropboxClient::downloadTree(const std::vector<std::string>& excludedFolders) {
    log::Registry::cloud()->info("[DropboxClient] Downloading Dropbox to {}", localRoot().string());

    fs::create_directories(localRoot());
    const auto listing = listFolder("", true);
    applyEntries(listing.entries, excludedFolders);
    return listing.cursor;
}

void DropboxClient::downloadFolder(const std::string& path) {
    log::Registry::cloud()->info("[DropboxClient] Downloading folder {}", path);

    const auto listing = listFolder(path, true);
    applyEntries(listing.entries, {});
}

void DropboxClient::setLocalRevisionMarker(const std::string& path, const std::optional<std::string>& rev) {
    revs_->set(path, rev);
}

// -------------------------------------------------------------------------
// changes
// -------------------------------------------------------------------------

PollResult DropboxClient::waitForChanges(const std::string& cursor, const std::chrono::seconds timeout,
                                         const std::atomic<bool>& interrupt) {
    const auto url = cfg_.notify_endpoint + "/files/list_folder/longpoll";
    const auto payload = json{{"cursor", cursor}, {"timeout", timeout.count()}}.dump();

    // longpoll is unauthenticated, the cursor identifies the account
    SList hdrs;
    hdrs.add("Content-Type: application/json");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>((timeout + LONGPOLL_JITTER).count()));
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &interrupt);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION,
            +[](void* ud, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
                return static_cast<const std::atomic<bool>*>(ud)->load() ? 1 : 0;
            });
    });

    if (resp.curl == CURLE_ABORTED_BY_CALLBACK) return {};
    if (!resp.ok()) throwForResponse("longpoll", resp.http, resp.curl, curl_easy_strerror(resp.curl), resp.body, resp.retryAfter);

    const auto j = json::parse(resp.body);

    PollResult result{.changes = j.value("changes", false)};
    if (j.contains("backoff")) {
        result.backoff = std::chrono::seconds(j["backoff"].get<int>());
        log::Registry::cloud()->debug("[DropboxClient] Server asked to back off {}s", result.backoff.count());
    }
    return result;
}

std::string DropboxClient::applyChanges(const std::string& cursor, const std::vector<std::string>& excludedFolders) {
    const auto listing = listFolderContinue(cursor);
    if (!listing.entries.empty()) applyEntries(listing.entries, excludedFolders);
    return listing.cursor;
}

// -------------------------------------------------------------------------
// account
// -------------------------------------------------------------------------

bool DropboxClient::checkConnection() {
    const auto url = cfg_.api_endpoint;
    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, 5L);
    });

    // Any HTTP answer means the servers are reachable
    return resp.curl == CURLE_OK && resp.http > 0 && resp.http < 500;
}

AccountInfo DropboxClient::accountInfo() {
    const auto j = rpc("/users/get_current_account", nullptr);
    return {
        .account_id = j.value("account_id", ""),
        .email = j.value("email", ""),
        .display_name = j.contains("name") ? j["name"].value("display_name", "") : "",
        .account_type = j.contains("account_type") ? j["account_type"].value(".tag", "") : ""
    };
}

void DropboxClient::unlink() {
    try {
        rpc("/auth/token/revoke", nullptr);
        log::Registry::cloud()->info("[DropboxClient] Access token revoked");
    } catch (const ConnectionError& e) {
        log::Registry::cloud()->warn("[DropboxClient] Could not revoke token, forgetting it locally: {}", e.what());
    } catch (const ApiError& e) {
        log::Registry::cloud()->warn("[DropboxClient] Token revocation refused, forgetting it locally: {}", e.what());
    }

    store_->set("account", "access_token", std::string{});
    store_->set("account", "mail", std::string{});
    store_->set("account", "type", std::string{});
    store_->set("account", "display_name", std::string{});
}

// -------------------------------------------------------------------------
// local root
// -------------------------------------------------------------------------

fs::path DropboxClient::localRoot() const {
    std::scoped_lock lock(rootMutex_);
    return root_;
}

void DropboxClient::setLocalRoot(const fs::path& root) {
    std::scoped_lock lock(rootMutex_);
    root_ = root;
    revs_->relocate(root_ / RevisionStore::FILE_NAME);
    log::Registry::cloud()->debug("[DropboxClient] Local root is now {}", root_.string());
}

fs::path DropboxClient::toLocalPath(const std::string& remotePath) const {
    return resolveCaseInsensitive(localRoot(), stripLeadingSlash(remotePath));
}
