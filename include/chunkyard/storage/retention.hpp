#pragma once

#include "chunkyard/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace chunkyard::storage {

/**
 * @brief Removes abandoned uploads from a storage root
 *
 * Every immediate child of the root whose modification time is more than
 * max_age in the past is deleted with its whole subtree. The first listing,
 * stat or removal error aborts the sweep; running it again re-evaluates
 * whatever is left. Set max_age conservatively: an upload that is still
 * receiving chunks only refreshes its directory mtime when a chunk lands.
 */
class RetentionSweeper {
public:
    /**
     * @return Number of top-level entries removed
     */
    Result<std::size_t> sweep(const std::filesystem::path& root, std::chrono::seconds max_age) const;
};

} // namespace chunkyard::storage
