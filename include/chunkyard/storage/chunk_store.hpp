#pragma once

#include "chunkyard/core/config.hpp"
#include "chunkyard/core/result.hpp"
#include "chunkyard/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>

namespace chunkyard::storage {

/**
 * @brief Persists one chunk payload at its canonical location
 *
 * The upload directory (and any missing parents) is created with the
 * configured directory mode; the chunk file replaces any earlier copy
 * atomically, so a client re-sending a chunk never leaves a torn file.
 */
class ChunkStore {
public:
    explicit ChunkStore(core::StorageOptions options) : options_(std::move(options)) {}

    /**
     * @brief Read payload to its end and write it to chunk_path
     *
     * @return Number of bytes written, or ErrorCode::CannotWriteFile wrapping
     *         the underlying cause
     */
    Result<std::uint64_t> store(const std::filesystem::path& upload_dir,
                                const std::filesystem::path& chunk_path,
                                const upload::UploadDescriptor& descriptor,
                                std::istream& payload) const;

private:
    core::StorageOptions options_;
};

} // namespace chunkyard::storage
