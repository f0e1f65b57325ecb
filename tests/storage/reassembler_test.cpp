#include "chunkyard/storage/reassembler.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace fs = std::filesystem;
using chunkyard::core::StorageOptions;
using chunkyard::storage::Reassembler;
using chunkyard::testing::TempDir;
using chunkyard::testing::read_file;
using chunkyard::testing::write_file;
using chunkyard::upload::UploadDescriptor;

namespace {

UploadDescriptor descriptor_for(const std::string& filename, std::uint64_t total_chunks, std::uint64_t total_size) {
    UploadDescriptor descriptor;
    descriptor.chunk_number = total_chunks;
    descriptor.total_chunks = total_chunks;
    descriptor.chunk_size = 1;
    descriptor.total_size = total_size;
    descriptor.identifier = "abc123";
    descriptor.filename = filename;
    descriptor.relative_path = filename;
    return descriptor;
}

std::vector<std::string> names_in(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

} // namespace

class ReassemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.root = dir_.path();
        upload_dir_ = dir_.path() / "abc123";
        fs::create_directories(upload_dir_);
    }

    TempDir dir_;
    StorageOptions options_;
    fs::path upload_dir_;
};

TEST_F(ReassemblerTest, CombinesChunksAndLeavesOnlyTheResult) {
    write_file(upload_dir_ / "1", "abc");
    write_file(upload_dir_ / "2", "def");
    write_file(upload_dir_ / "3", "ghi");

    Reassembler reassembler(options_);
    auto result = reassembler.combine(upload_dir_, descriptor_for("foo.txt", 3, 9));

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_TRUE(result.value().is_absolute());
    EXPECT_EQ(result.value().filename(), "foo.txt");
    EXPECT_EQ(read_file(upload_dir_ / "foo.txt"), "abcdefghi");
    EXPECT_EQ(names_in(upload_dir_), std::vector<std::string>{"foo.txt"});
}

TEST_F(ReassemblerTest, OrdersChunksNumericallyPastNine) {
    std::string expected;
    for (int i = 1; i <= 12; ++i) {
        const std::string piece(1, static_cast<char>('a' + i - 1));
        write_file(upload_dir_ / std::to_string(i), piece);
        expected += piece;
    }

    Reassembler reassembler(options_);
    auto result = reassembler.combine(upload_dir_, descriptor_for("letters.txt", 12, 12));

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(read_file(upload_dir_ / "letters.txt"), expected);
}

TEST_F(ReassemblerTest, OrderedInputsPutsNonNumericNamesLast) {
    write_file(upload_dir_ / "10", "");
    write_file(upload_dir_ / "notes", "");
    write_file(upload_dir_ / "2", "");
    write_file(upload_dir_ / "out.bin", "");
    write_file(upload_dir_ / "1", "");

    auto inputs = Reassembler::ordered_inputs(upload_dir_, "out.bin");

    ASSERT_TRUE(inputs.is_ok());
    std::vector<std::string> names;
    for (const auto& path : inputs.value()) {
        names.push_back(path.filename().string());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"1", "2", "10", "notes"}));
}

TEST_F(ReassemblerTest, AppliesFileMode) {
    options_.file_mode = static_cast<fs::perms>(0644);
    write_file(upload_dir_ / "1", "abc");

    Reassembler reassembler(options_);
    ASSERT_TRUE(reassembler.combine(upload_dir_, descriptor_for("foo.txt", 1, 3)).is_ok());

    EXPECT_EQ(chunkyard::testing::mode_of(upload_dir_ / "foo.txt"), static_cast<fs::perms>(0644));
}

TEST_F(ReassemblerTest, PreexistingDestinationIsTruncated) {
    write_file(upload_dir_ / "foo.txt", "stale contents that are long");
    write_file(upload_dir_ / "1", "new");

    Reassembler reassembler(options_);
    ASSERT_TRUE(reassembler.combine(upload_dir_, descriptor_for("foo.txt", 1, 3)).is_ok());

    EXPECT_EQ(read_file(upload_dir_ / "foo.txt"), "new");
}

TEST_F(ReassemblerTest, NumericFilenameIsRejectedBeforeTouchingChunks) {
    write_file(upload_dir_ / "1", "AAA");
    write_file(upload_dir_ / "2", "BBB");
    write_file(upload_dir_ / "3", "CCC");

    Reassembler reassembler(options_);
    auto result = reassembler.combine(upload_dir_, descriptor_for("2", 3, 9));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, chunkyard::ErrorCode::InvalidDescriptor);
    EXPECT_EQ(read_file(upload_dir_ / "2"), "BBB");
    EXPECT_EQ(names_in(upload_dir_).size(), 3u);
}

TEST_F(ReassemblerTest, ShortResultIsAnError) {
    write_file(upload_dir_ / "1", "abc");
    write_file(upload_dir_ / "3", "ghi");

    Reassembler reassembler(options_);
    auto result = reassembler.combine(upload_dir_, descriptor_for("foo.txt", 3, 9));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, chunkyard::ErrorCode::IoError);
    EXPECT_EQ(read_file(upload_dir_ / "foo.txt"), "abcghi");
}

TEST_F(ReassemblerTest, RetryOverPartialDestinationFailsTheSizeCheck) {
    // State left by a combine that died after consuming chunk 1
    write_file(upload_dir_ / "foo.txt", "abc");
    write_file(upload_dir_ / "2", "def");
    write_file(upload_dir_ / "3", "ghi");

    Reassembler reassembler(options_);
    auto result = reassembler.combine(upload_dir_, descriptor_for("foo.txt", 3, 9));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, chunkyard::ErrorCode::IoError);
}

TEST_F(ReassemblerTest, MissingUploadDirectoryFails) {
    Reassembler reassembler(options_);

    auto result = reassembler.combine(dir_.path() / "nope", descriptor_for("foo.txt", 1, 3));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, chunkyard::ErrorCode::CannotWriteFile);
}
