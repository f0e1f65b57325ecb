#pragma once

#include "chunkyard/core/config.hpp"
#include "chunkyard/core/result.hpp"
#include "chunkyard/upload/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace chunkyard::storage {

/**
 * @brief Concatenates the chunks of a finished upload into its final file
 *
 * The destination is created (or truncated) as upload_dir/<filename>. Every
 * other entry in upload_dir is appended to it and removed as soon as it has
 * been copied. Chunks are consumed in numeric index order ("2" before "10");
 * entries whose names are not chunk indices come last, in name order.
 *
 * The filename must not parse as a chunk index, or the destination would be
 * one of the chunks. The combined length must equal descriptor.total_size;
 * a short or long result is reported as IoError and the file is left as is.
 *
 * Not transactional: if a step fails the destination may hold a prefix of
 * the data and the chunks already copied are gone. Calling combine again
 * overwrites the destination with whatever chunks remain, and then fails the
 * size check.
 */
class Reassembler {
public:
    explicit Reassembler(core::StorageOptions options) : options_(std::move(options)) {}

    /**
     * @return Absolute path of the combined file
     */
    Result<std::filesystem::path> combine(const std::filesystem::path& upload_dir,
                                          const upload::UploadDescriptor& descriptor) const;

    /**
     * @brief Entries of upload_dir in the order combine() consumes them
     *
     * The destination itself is excluded.
     */
    static Result<std::vector<std::filesystem::path>> ordered_inputs(const std::filesystem::path& upload_dir,
                                                                     const std::string& destination_name);

private:
    core::StorageOptions options_;
};

} // namespace chunkyard::storage
