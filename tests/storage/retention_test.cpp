#include "chunkyard/storage/retention.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using chunkyard::storage::RetentionSweeper;
using chunkyard::testing::TempDir;
using chunkyard::testing::write_file;

namespace {

void backdate(const fs::path& path, std::chrono::seconds age) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

fs::path make_upload(const fs::path& root, const std::string& name, std::chrono::seconds age) {
    const auto dir = root / name;
    fs::create_directories(dir);
    write_file(dir / "1", "chunk");
    backdate(dir, age);
    return dir;
}

} // namespace

TEST(RetentionSweeperTest, RemovesOnlyEntriesOlderThanMaxAge) {
    TempDir root;
    const auto stale = make_upload(root.path(), "stale", 48h);
    const auto fresh = make_upload(root.path(), "fresh", 1h);

    RetentionSweeper sweeper;
    auto result = sweeper.sweep(root.path(), 24h);

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value(), 1u);
    EXPECT_FALSE(fs::exists(stale));
    EXPECT_TRUE(fs::exists(fresh / "1"));
}

TEST(RetentionSweeperTest, SecondSweepIsNoOp) {
    TempDir root;
    make_upload(root.path(), "stale", 48h);
    make_upload(root.path(), "fresh", 1h);

    RetentionSweeper sweeper;
    ASSERT_TRUE(sweeper.sweep(root.path(), 24h).is_ok());

    auto again = sweeper.sweep(root.path(), 24h);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), 0u);
    EXPECT_TRUE(fs::exists(root.path() / "fresh"));
}

TEST(RetentionSweeperTest, StrayTopLevelFilesAreSweptToo) {
    TempDir root;
    const auto file = root.path() / "leftover.bin";
    write_file(file, "data");
    backdate(file, 10h);

    RetentionSweeper sweeper;
    auto result = sweeper.sweep(root.path(), 1h);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 1u);
    EXPECT_FALSE(fs::exists(file));
}

TEST(RetentionSweeperTest, EmptyRootRemovesNothing) {
    TempDir root;
    RetentionSweeper sweeper;

    auto result = sweeper.sweep(root.path(), 0s);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 0u);
}

TEST(RetentionSweeperTest, MissingRootIsAnError) {
    TempDir root;
    RetentionSweeper sweeper;

    auto result = sweeper.sweep(root.path() / "missing", 1h);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, chunkyard::ErrorCode::IoError);
}
