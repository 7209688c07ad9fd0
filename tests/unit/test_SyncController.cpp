#include <gtest/gtest.h>
#include "SyncFakes.hpp"
#include "sync/SyncController.hpp"
#include "sync/guards.hpp"
#include "sync/Monitor.hpp"
#include "config/ConfigStore.hpp"
#include "shell/Prompt.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;
using namespace sdbx;
using namespace sdbx::test;

using Folders = std::vector<std::string>;

class SyncControllerTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path root;

    std::shared_ptr<config::MemoryConfigStore> store = std::make_shared<config::MemoryConfigStore>();
    std::shared_ptr<FakeRemoteClient> client = std::make_shared<FakeRemoteClient>();
    std::shared_ptr<FakeMonitor> monitor = std::make_shared<FakeMonitor>();

    std::istringstream in;
    std::ostringstream out;
    std::shared_ptr<shell::Prompt> prompt = std::make_shared<shell::Prompt>(in, out);

    void SetUp() override {
        root = tmp.path() / "Dropbox";
        fs::create_directories(root);
        client->setLocalRoot(root);

        store->set("main", "path", root.string());
        store->set("internal", "cursor", std::string("cursor-0"));
        store->set("internal", "lastsync", 1700000000.0);
    }

    std::unique_ptr<sync::SyncController> makeController(const std::string& answers = "", const bool run = true) {
        in.str(answers);
        in.clear();
        return std::make_unique<sync::SyncController>(store, client, monitor, prompt, run);
    }

    Folders excluded() const { return store->getStringList("main", "excluded_folders"); }
};

TEST_F(SyncControllerTest, ExistingSyncSkipsBootstrap) {
    const auto ctl = makeController();

    EXPECT_FALSE(ctl->isFirstSync());
    EXPECT_TRUE(ctl->isSyncing());
    EXPECT_FALSE(ctl->isPausedByUser());
    EXPECT_FALSE(monitor->stoppedByUser);
    EXPECT_EQ(client->networkCalls, 0);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(SyncControllerTest, RunFalseLeavesSyncPaused) {
    const auto ctl = makeController("", false);

    EXPECT_FALSE(ctl->isSyncing());
    EXPECT_TRUE(ctl->isPausedByUser());
    EXPECT_EQ(monitor->starts, 0);
}

TEST_F(SyncControllerTest, ExcludeFolderIsIdempotent) {
    touch(root / "photos" / "holiday.jpg");
    const auto ctl = makeController();

    ctl->excludeFolder("/Photos");
    ctl->excludeFolder("/photos/");

    EXPECT_EQ(excluded(), Folders{"/photos"});
    EXPECT_FALSE(fs::exists(root / "photos"));
    EXPECT_EQ(client->clearedMarkers, (Folders{"/photos", "/photos"}));
    EXPECT_EQ(client->networkCalls, 0);
}

TEST_F(SyncControllerTest, ExcludeRootIsRejected) {
    const auto ctl = makeController();

    EXPECT_THROW(ctl->excludeFolder("/"), std::invalid_argument);
    EXPECT_TRUE(excluded().empty());
    EXPECT_TRUE(ctl->isSyncing());
}

TEST_F(SyncControllerTest, ExcludeThenIncludeDownloadsOnce) {
    const auto ctl = makeController();

    ctl->excludeFolder("/a");
    EXPECT_TRUE(ctl->includeFolder("/a"));

    EXPECT_TRUE(excluded().empty());
    EXPECT_EQ(client->downloadedFolders, Folders{"/a"});
    EXPECT_TRUE(fs::exists(root / "a" / "other.txt"));
}

TEST_F(SyncControllerTest, IncludingIncludedFolderIsNoop) {
    store->set("main", "excluded_folders", Folders{"/x"});
    const auto ctl = makeController();

    EXPECT_TRUE(ctl->includeFolder("/b"));

    EXPECT_EQ(client->networkCalls, 0);
    EXPECT_EQ(excluded(), Folders{"/x"});
}

TEST_F(SyncControllerTest, PauseWrappedOperationsRestoreRunningState) {
    const auto ctl = makeController();
    ASSERT_EQ(monitor->starts, 1);

    ctl->excludeFolder("/a");
    EXPECT_TRUE(ctl->isSyncing());
    EXPECT_EQ(monitor->stops, 1);
    EXPECT_EQ(monitor->starts, 2);

    EXPECT_TRUE(ctl->includeFolder("/a"));
    EXPECT_TRUE(ctl->isSyncing());

    ctl->setDropboxDirectory(tmp.path() / "Elsewhere");
    EXPECT_TRUE(ctl->isSyncing());
    EXPECT_FALSE(monitor->stoppedByUser);
}

TEST_F(SyncControllerTest, PauseWrappedOperationsKeepPausedSyncPaused) {
    const auto ctl = makeController("", false);

    ctl->excludeFolder("/a");
    EXPECT_TRUE(ctl->includeFolder("/a"));

    EXPECT_FALSE(ctl->isSyncing());
    EXPECT_EQ(monitor->starts, 0);
    EXPECT_EQ(monitor->stops, 0);
}

TEST_F(SyncControllerTest, PauseWrappedOperationsHoldSyncStoppedByLostConnection) {
    const auto ctl = makeController();

    // the monitor dropped syncing on its own, the user never paused
    monitor->running = false;
    monitor->connected = false;

    bool heldDuringOp = false;
    ctl->excludeFolder("/a");
    sync::withSyncPaused(*ctl, [&] { heldDuringOp = monitor->stoppedByUser; });

    EXPECT_TRUE(heldDuringOp);
    EXPECT_FALSE(monitor->stoppedByUser);
    EXPECT_FALSE(ctl->isPausedByUser());
    EXPECT_FALSE(ctl->isSyncing());

    monitor->connected = true;
    sync::withSyncPaused(*ctl, [] {});
    EXPECT_TRUE(ctl->isSyncing());
}

TEST_F(SyncControllerTest, ReconnectDuringPausedOperationDoesNotRestartSync) {
    using namespace std::chrono_literals;

    const auto realMonitor = std::make_shared<sync::Monitor>(client, store, config::MonitorConfig{
        .connection_check_interval = 1s,
        .longpoll_timeout = 30s,
        .retry_backoff = 1s,
    });
    sync::SyncController ctl(store, client, realMonitor, prompt);
    ASSERT_TRUE(ctl.isSyncing());

    client->reachable = false;
    ASSERT_TRUE(waitFor([&] { return !ctl.isConnected(); }));
    ASSERT_FALSE(ctl.isSyncing());

    bool restartedDuringOp = true;
    sync::withSyncPaused(ctl, [&] {
        client->reachable = true;
        ASSERT_TRUE(waitFor([&] { return ctl.isConnected(); }));
        restartedDuringOp = waitFor([&] { return ctl.isSyncing(); }, 500ms);
    });

    EXPECT_FALSE(restartedDuringOp);
    EXPECT_TRUE(ctl.isSyncing());
    EXPECT_FALSE(ctl.isPausedByUser());

    ctl.pauseSync();
}

TEST_F(SyncControllerTest, DisconnectedOperationsMakeNoRemoteCalls) {
    store->set("main", "excluded_folders", Folders{"/x"});
    monitor->connected = false;
    const auto ctl = makeController();

    EXPECT_FALSE(ctl->includeFolder("/x"));
    EXPECT_FALSE(ctl->selectExcludedFolders());
    EXPECT_FALSE(ctl->refreshAccountInfo());

    EXPECT_EQ(client->networkCalls, 0);
    EXPECT_EQ(excluded(), Folders{"/x"});
    EXPECT_NE(out.str().find(sync::CONNECTION_ERROR_MSG), std::string::npos);
    EXPECT_TRUE(ctl->isSyncing());
}

TEST_F(SyncControllerTest, FailedInclusionKeepsFolderExcluded) {
    store->set("main", "excluded_folders", Folders{"/x"});
    client->failDownloadFolder = true;
    const auto ctl = makeController();

    EXPECT_FALSE(ctl->includeFolder("/x"));

    EXPECT_EQ(excluded(), Folders{"/x"});
    EXPECT_FALSE(fs::exists(root / "x"));
    EXPECT_EQ(client->clearedMarkers, Folders{"/x"});
    EXPECT_NE(out.str().find(sync::CONNECTION_ERROR_MSG), std::string::npos);
    EXPECT_TRUE(ctl->isSyncing());
}

TEST_F(SyncControllerTest, BootstrapWithoutLastSync) {
    store->set("main", "path", std::string{});
    store->set("internal", "lastsync", std::monostate{});
    client->addFolder("/Docs");
    client->addFolder("/Photos");
    client->addFile("/Readme.txt");

    const auto target = tmp.path() / "NewDropbox";
    const auto ctl = makeController(target.string() + "\nn\ny\n");

    EXPECT_FALSE(ctl->isFirstSync());
    EXPECT_TRUE(ctl->isSyncing());

    EXPECT_EQ(fs::path(store->getString("main", "path")), target);
    EXPECT_EQ(ctl->getDropboxDirectory(), target);
    EXPECT_EQ(excluded(), Folders{"/photos"});

    ASSERT_EQ(client->treeDownloads.size(), 1u);
    EXPECT_EQ(client->treeDownloads.front(), Folders{"/photos"});
    EXPECT_TRUE(client->downloadedFolders.empty());

    EXPECT_EQ(store->getString("internal", "cursor"), "cursor-1");
    EXPECT_TRUE(store->getTimestamp("internal", "lastsync").has_value());

    EXPECT_TRUE(fs::exists(target / "Docs" / "file.txt"));
    EXPECT_TRUE(fs::exists(target / "Readme.txt"));
    EXPECT_FALSE(fs::exists(target / "Photos"));

    EXPECT_NE(out.str().find("Exclude '/Photos' from sync? [N/y] "), std::string::npos);
    EXPECT_EQ(out.str().find("Readme.txt"), std::string::npos);
}

TEST_F(SyncControllerTest, FailedBootstrapIsRetriedNextTime) {
    store->set("internal", "lastsync", std::monostate{});
    client->addFolder("/Docs");
    client->failDownloadTree = true;

    // Existing folder is confirmed for overwrite, then Docs is kept
    const auto ctl = makeController(root.string() + "\ny\nn\n");

    EXPECT_TRUE(ctl->isFirstSync());
    EXPECT_EQ(store->getString("internal", "cursor"), "");
    EXPECT_FALSE(store->getTimestamp("internal", "lastsync").has_value());
    EXPECT_NE(out.str().find(sync::CONNECTION_ERROR_MSG), std::string::npos);
}

TEST_F(SyncControllerTest, MissingLocalFolderTriggersBootstrap) {
    fs::remove_all(root);
    const auto ctl = makeController("\n");

    EXPECT_FALSE(ctl->isFirstSync());
    EXPECT_TRUE(fs::is_directory(root));
    EXPECT_EQ(client->treeDownloads.size(), 1u);
}

TEST_F(SyncControllerTest, BootstrapOverwritesFileAtChosenFolder) {
    fs::remove_all(root);
    const auto target = tmp.path() / "B";
    touch(target, "not a folder");

    // chosen path exists, overwrite is confirmed
    const auto ctl = makeController(target.string() + "\ny\n");

    EXPECT_TRUE(fs::is_directory(target));
    EXPECT_EQ(ctl->getDropboxDirectory(), target);
    EXPECT_EQ(fs::path(store->getString("main", "path")), target);
    EXPECT_FALSE(ctl->isFirstSync());
}

TEST_F(SyncControllerTest, RelocationMovesFolder) {
    touch(root / "notes.txt", "hello");
    const auto target = tmp.path() / "B";
    const auto ctl = makeController();

    ctl->setDropboxDirectory(target);

    EXPECT_FALSE(fs::exists(root));
    EXPECT_TRUE(fs::exists(target / "notes.txt"));
    EXPECT_EQ(fs::path(store->getString("main", "path")), target);
    EXPECT_EQ(ctl->getDropboxDirectory(), target);
}

TEST_F(SyncControllerTest, RelocationOverwritesExistingTarget) {
    touch(root / "notes.txt");
    const auto target = tmp.path() / "B";
    touch(target / "stale.txt");
    const auto ctl = makeController();

    ctl->setDropboxDirectory(target);

    EXPECT_FALSE(fs::exists(target / "stale.txt"));
    EXPECT_TRUE(fs::exists(target / "notes.txt"));
}

TEST_F(SyncControllerTest, RelocationPromptsWhenNoPathGiven) {
    touch(root / "notes.txt");
    const auto target = tmp.path() / "Prompted";
    const auto ctl = makeController();

    in.str(target.string() + "\n");
    in.clear();
    ctl->setDropboxDirectory();

    EXPECT_TRUE(fs::exists(target / "notes.txt"));
    EXPECT_NE(out.str().find("[" + root.string() + "]"), std::string::npos);
}

TEST_F(SyncControllerTest, RelocationToSameFolderIsNoop) {
    touch(root / "notes.txt");
    const auto ctl = makeController();

    ctl->setDropboxDirectory(root);

    EXPECT_TRUE(fs::exists(root / "notes.txt"));
    EXPECT_EQ(fs::path(store->getString("main", "path")), root);
}

TEST_F(SyncControllerTest, RelocationIntoOwnSubfolderIsRejected) {
    touch(root / "notes.txt");
    const auto ctl = makeController();

    EXPECT_THROW(ctl->setDropboxDirectory(root / "nested"), std::invalid_argument);
    EXPECT_THROW(ctl->setDropboxDirectory(tmp.path()), std::invalid_argument);

    EXPECT_TRUE(fs::exists(root / "notes.txt"));
    EXPECT_TRUE(ctl->isSyncing());
}

TEST_F(SyncControllerTest, SelectionAppliesExclusionsAndInclusions) {
    store->set("main", "excluded_folders", Folders{"/x", "/y"});
    client->addFolder("/x");
    client->addFolder("/y");
    client->addFolder("/z");
    touch(root / "z" / "file.txt");
    const auto ctl = makeController();

    in.str("y\nn\ny\n");
    in.clear();
    EXPECT_TRUE(ctl->selectExcludedFolders());

    EXPECT_EQ(excluded(), (Folders{"/x", "/z"}));
    EXPECT_EQ(client->downloadedFolders, Folders{"/y"});
    EXPECT_FALSE(fs::exists(root / "z"));
    EXPECT_TRUE(fs::exists(root / "y" / "other.txt"));
    EXPECT_TRUE(ctl->isSyncing());
}

TEST_F(SyncControllerTest, SelectionExcludesBeforeIncluding) {
    store->set("main", "excluded_folders", Folders{"/a", "/c"});
    client->addFolder("/a");
    client->addFolder("/b");
    client->addFolder("/c");
    client->addFolder("/d");
    const auto ctl = makeController();

    in.str("n\ny\nn\ny\n");
    in.clear();
    EXPECT_TRUE(ctl->selectExcludedFolders());

    EXPECT_EQ(client->events, (Folders{"exclude:/b", "exclude:/d", "include:/a", "include:/c"}));
    EXPECT_EQ(excluded(), (Folders{"/b", "/d"}));
}

TEST_F(SyncControllerTest, SelectionKeepsFolderWhoseInclusionFailed) {
    store->set("main", "excluded_folders", Folders{"/y"});
    client->addFolder("/y");
    client->failDownloadFolder = true;
    const auto ctl = makeController();

    in.str("n\n");
    in.clear();
    EXPECT_TRUE(ctl->selectExcludedFolders());

    EXPECT_EQ(excluded(), Folders{"/y"});
    EXPECT_FALSE(fs::exists(root / "y"));
}

TEST_F(SyncControllerTest, QuitDuringSelectionLeavesStateUntouched) {
    store->set("main", "excluded_folders", Folders{"/x"});
    client->addFolder("/x");
    client->addFolder("/y");
    const auto ctl = makeController();

    in.str("q\n");
    in.clear();
    EXPECT_THROW((void)ctl->selectExcludedFolders(), shell::QuitRequested);

    EXPECT_EQ(excluded(), Folders{"/x"});
    EXPECT_NE(out.str().find("Exit"), std::string::npos);
}

TEST_F(SyncControllerTest, DescribeShowsAccountWhenConnected) {
    const auto ctl = makeController();

    ASSERT_TRUE(ctl->refreshAccountInfo());
    EXPECT_EQ(ctl->describe(), "SisyphosDBX(franz@example.com, basic)");
    EXPECT_EQ(store->getString("account", "display_name"), "Franz Ferdinand");

    std::ostringstream os;
    os << *ctl;
    EXPECT_EQ(os.str(), ctl->describe());

    monitor->connected = false;
    EXPECT_EQ(ctl->describe(), "SisyphosDBX(Connecting...)");
}

TEST_F(SyncControllerTest, UnlinkStopsSyncing) {
    touch(root / "notes.txt");
    const auto ctl = makeController();

    ctl->unlink();

    EXPECT_EQ(client->unlinks, 1);
    EXPECT_FALSE(ctl->isSyncing());
    EXPECT_TRUE(ctl->isPausedByUser());
    EXPECT_TRUE(monitor->stoppedByUser);
    EXPECT_TRUE(fs::exists(root / "notes.txt"));
}

TEST_F(SyncControllerTest, ResumeAfterPause) {
    const auto ctl = makeController();

    ctl->pauseSync();
    EXPECT_FALSE(ctl->isSyncing());
    EXPECT_TRUE(monitor->stoppedByUser);

    ctl->resumeSync();
    EXPECT_TRUE(ctl->isSyncing());
    EXPECT_FALSE(monitor->stoppedByUser);
}
