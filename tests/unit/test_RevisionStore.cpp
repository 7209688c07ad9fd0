#include <gtest/gtest.h>
#include "SyncFakes.hpp"
#include "cloud/RevisionStore.hpp"

#include <fstream>

namespace fs = std::filesystem;
using namespace sdbx::cloud;
using sdbx::test::TempDir;

class RevisionStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path file() const { return tmp.path() / RevisionStore::FILE_NAME; }
};

TEST_F(RevisionStoreTest, LookupIgnoresCase) {
    RevisionStore revs(file());
    revs.set("/Photos/Beach.jpg", "015f9a");

    EXPECT_EQ(revs.get("/photos/beach.jpg"), "015f9a");
    EXPECT_FALSE(revs.get("/photos/other.jpg").has_value());
}

TEST_F(RevisionStoreTest, ClearingFolderDropsEverythingBelow) {
    RevisionStore revs(file());
    revs.set("/photos", "folder");
    revs.set("/photos/a.jpg", "1");
    revs.set("/photos/2024/b.jpg", "2");
    revs.set("/photos-old/c.jpg", "3");

    revs.set("/Photos", std::nullopt);

    EXPECT_EQ(revs.size(), 1u);
    EXPECT_EQ(revs.get("/photos-old/c.jpg"), "3");
}

TEST_F(RevisionStoreTest, PersistsAcrossInstances) {
    {
        RevisionStore revs(file());
        revs.set("/docs/cv.pdf", "a1b2");
    }

    const RevisionStore revs(file());
    EXPECT_EQ(revs.get("/docs/cv.pdf"), "a1b2");
}

TEST_F(RevisionStoreTest, CorruptFileStartsEmpty) {
    std::ofstream(file()) << "{ not json";

    const RevisionStore revs(file());
    EXPECT_EQ(revs.size(), 0u);
}

TEST_F(RevisionStoreTest, RelocateWritesToNewFile) {
    RevisionStore revs(file());
    revs.set("/docs/cv.pdf", "a1b2");

    const auto moved = tmp.path() / "elsewhere" / RevisionStore::FILE_NAME;
    revs.relocate(moved);

    EXPECT_EQ(revs.file(), moved);
    const RevisionStore reloaded(moved);
    EXPECT_EQ(reloaded.get("/docs/cv.pdf"), "a1b2");
}

TEST_F(RevisionStoreTest, UnboundStoreIgnoresWorkingDirectory) {
    std::ofstream(file()) << R"({"/stale/file.txt": "0ff1ce"})";

    const auto cwd = fs::current_path();
    fs::current_path(tmp.path());

    RevisionStore revs{fs::path{}};
    revs.set("/docs/cv.pdf", "a1b2");
    fs::current_path(cwd);

    EXPECT_EQ(revs.size(), 1u);
    EXPECT_FALSE(revs.get("/stale/file.txt").has_value());

    // nothing was written until a file is named
    EXPECT_EQ(RevisionStore(file()).size(), 1u);

    const auto bound = tmp.path() / "Dropbox" / RevisionStore::FILE_NAME;
    revs.relocate(bound);
    EXPECT_EQ(RevisionStore(bound).get("/docs/cv.pdf"), "a1b2");
    EXPECT_EQ(RevisionStore(bound).size(), 1u);
}
