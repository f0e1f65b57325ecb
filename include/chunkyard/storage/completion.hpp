#pragma once

#include <cstdint>
#include <filesystem>

namespace chunkyard::storage {

/**
 * @brief Decides completion from the bytes already on disk
 *
 * There is no manifest: an upload is complete when the sizes of all entries
 * in its directory add up to the declared total. Listing or stat failures
 * are logged and count as zero bytes, so a check may under-report but never
 * fails.
 */
class CompletionOracle {
public:
    std::uint64_t received_bytes(const std::filesystem::path& upload_dir) const;

    bool is_complete(const std::filesystem::path& upload_dir, std::uint64_t total_size) const {
        return received_bytes(upload_dir) == total_size;
    }
};

} // namespace chunkyard::storage
