#include "chunkyard/storage/chunk_store.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace fs = std::filesystem;
using chunkyard::ErrorCode;
using chunkyard::core::StorageOptions;
using chunkyard::storage::ChunkStore;
using chunkyard::testing::TempDir;
using chunkyard::upload::UploadDescriptor;
using chunkyard::upload::make_upload_paths;

namespace {

UploadDescriptor descriptor_for(std::uint64_t chunk) {
    UploadDescriptor descriptor;
    descriptor.chunk_number = chunk;
    descriptor.total_chunks = 3;
    descriptor.chunk_size = 3;
    descriptor.total_size = 9;
    descriptor.identifier = "abc123";
    descriptor.filename = "foo.txt";
    descriptor.relative_path = "foo.txt";
    return descriptor;
}

} // namespace

class ChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.root = dir_.path();
    }

    TempDir dir_;
    StorageOptions options_;
};

TEST_F(ChunkStoreTest, WritesChunkUnderIdentifierDirectory) {
    ChunkStore store(options_);
    const auto descriptor = descriptor_for(1);
    const auto paths = make_upload_paths(options_.root, descriptor);
    std::istringstream payload("abc");

    auto result = store.store(paths.upload_dir, paths.chunk_path, descriptor, payload);

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value(), 3u);
    EXPECT_EQ(paths.chunk_path, dir_.path() / "abc123" / "1");
    EXPECT_EQ(chunkyard::testing::read_file(paths.chunk_path), "abc");
}

TEST_F(ChunkStoreTest, AppliesConfiguredModes) {
    options_.directory_mode = static_cast<fs::perms>(0750);
    options_.file_mode = static_cast<fs::perms>(0640);
    ChunkStore store(options_);
    const auto descriptor = descriptor_for(2);
    const auto paths = make_upload_paths(options_.root, descriptor);
    std::istringstream payload("def");

    ASSERT_TRUE(store.store(paths.upload_dir, paths.chunk_path, descriptor, payload).is_ok());

    EXPECT_EQ(chunkyard::testing::mode_of(paths.upload_dir), static_cast<fs::perms>(0750));
    EXPECT_EQ(chunkyard::testing::mode_of(paths.chunk_path), static_cast<fs::perms>(0640));
}

TEST_F(ChunkStoreTest, ResendReplacesPreviousContents) {
    ChunkStore store(options_);
    const auto descriptor = descriptor_for(1);
    const auto paths = make_upload_paths(options_.root, descriptor);

    std::istringstream first("xxxxxx");
    ASSERT_TRUE(store.store(paths.upload_dir, paths.chunk_path, descriptor, first).is_ok());
    std::istringstream second("abc");
    ASSERT_TRUE(store.store(paths.upload_dir, paths.chunk_path, descriptor, second).is_ok());

    EXPECT_EQ(chunkyard::testing::read_file(paths.chunk_path), "abc");
    // No temporary siblings left behind
    EXPECT_EQ(std::distance(fs::directory_iterator(paths.upload_dir), fs::directory_iterator()), 1);
}

TEST_F(ChunkStoreTest, EmptyPayloadStoresEmptyChunk) {
    ChunkStore store(options_);
    const auto descriptor = descriptor_for(1);
    const auto paths = make_upload_paths(options_.root, descriptor);
    std::istringstream payload("");

    auto result = store.store(paths.upload_dir, paths.chunk_path, descriptor, payload);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 0u);
    EXPECT_EQ(fs::file_size(paths.chunk_path), 0u);
}

TEST_F(ChunkStoreTest, UploadDirectoryBlockedByFileFails) {
    ChunkStore store(options_);
    const auto descriptor = descriptor_for(1);
    const auto paths = make_upload_paths(options_.root, descriptor);
    chunkyard::testing::write_file(paths.upload_dir, "not a directory");
    std::istringstream payload("abc");

    auto result = store.store(paths.upload_dir, paths.chunk_path, descriptor, payload);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::CannotWriteFile);
    EXPECT_EQ(result.error().message.rfind("Unable to store chunk: ", 0), 0u);
}

TEST_F(ChunkStoreTest, ChunkPathOccupiedByDirectoryFails) {
    ChunkStore store(options_);
    const auto descriptor = descriptor_for(1);
    const auto paths = make_upload_paths(options_.root, descriptor);
    fs::create_directories(paths.chunk_path / "nested");
    std::istringstream payload("abc");

    auto result = store.store(paths.upload_dir, paths.chunk_path, descriptor, payload);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::CannotWriteFile);
}
