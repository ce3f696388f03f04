#include <filesystem>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "sandbox/snapshot.hpp"

using namespace std;
using namespace tci;
namespace fs = std::filesystem;

class SnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = SANDBOX_DIR / "snapshot-test";
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    fs::path dir;
};

TEST_F(SnapshotTest, DetectsChangedAndDeletedFiles) {
    write_file_content(dir / "keep.txt", "same");
    write_file_content(dir / "edit.txt", "before");
    write_file_content(dir / "gone.txt", "bye");
    directory_snapshot before = take_snapshot(dir);
    EXPECT_EQ(before.size(), 3u);

    write_file_content(dir / "edit.txt", "after!");
    fs::remove(dir / "gone.txt");
    write_file_content(dir / "sub" / "new.txt", "new");

    directory_delta delta = diff_snapshot(before, take_snapshot(dir));
    EXPECT_EQ(delta.changed, (vector<string>{"edit.txt", "sub/new.txt"}));
    EXPECT_EQ(delta.deleted, (vector<string>{"gone.txt"}));
}

TEST_F(SnapshotTest, SameSizeRewriteIsDetected) {
    write_file_content(dir / "data", "aaaa");
    directory_snapshot before = take_snapshot(dir);
    write_file_content(dir / "data", "bbbb");
    directory_delta delta = diff_snapshot(before, take_snapshot(dir));
    EXPECT_EQ(delta.changed, (vector<string>{"data"}));
    EXPECT_TRUE(delta.deleted.empty());
}

TEST_F(SnapshotTest, SymlinksAreIgnored) {
    write_file_content(SANDBOX_DIR / "snapshot-outside.txt", "host secret");
    fs::create_symlink(SANDBOX_DIR / "snapshot-outside.txt", dir / "link.txt");
    fs::create_directory_symlink(SANDBOX_DIR, dir / "escape");

    directory_snapshot snapshot = take_snapshot(dir);
    EXPECT_TRUE(snapshot.empty());
    fs::remove(SANDBOX_DIR / "snapshot-outside.txt");
}

TEST_F(SnapshotTest, MissingDirectoryIsEmpty) {
    EXPECT_TRUE(take_snapshot(dir / "missing").empty());
}
