#include "chunkyard/storage/completion.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

using chunkyard::storage::CompletionOracle;
using chunkyard::testing::TempDir;
using chunkyard::testing::write_file;

TEST(CompletionOracleTest, SumsEveryEntryInTheUploadDirectory) {
    TempDir dir;
    write_file(dir.path() / "1", "abc");
    write_file(dir.path() / "2", "defg");
    write_file(dir.path() / "3", "h");

    CompletionOracle oracle;

    EXPECT_EQ(oracle.received_bytes(dir.path()), 8u);
    EXPECT_TRUE(oracle.is_complete(dir.path(), 8));
    EXPECT_FALSE(oracle.is_complete(dir.path(), 7));
    EXPECT_FALSE(oracle.is_complete(dir.path(), 9));
}

TEST(CompletionOracleTest, MissingDirectoryCountsAsNothing) {
    TempDir dir;
    CompletionOracle oracle;

    EXPECT_EQ(oracle.received_bytes(dir.path() / "never-created"), 0u);
    EXPECT_FALSE(oracle.is_complete(dir.path() / "never-created", 5));
}

TEST(CompletionOracleTest, EmptyDirectoryCompletesZeroByteUpload) {
    TempDir dir;
    CompletionOracle oracle;

    EXPECT_TRUE(oracle.is_complete(dir.path(), 0));
}

TEST(CompletionOracleTest, OversizedFinalChunkIsCounted) {
    TempDir dir;
    // chunk size 4, total 10: the last chunk carries the remainder
    write_file(dir.path() / "1", "aaaa");
    write_file(dir.path() / "2", "bbbbbb");

    CompletionOracle oracle;
    EXPECT_TRUE(oracle.is_complete(dir.path(), 10));
}
