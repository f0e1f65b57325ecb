#pragma once

#include "chunkyard/core/config.hpp"
#include "chunkyard/core/result.hpp"
#include "chunkyard/events/event_bus.hpp"
#include "chunkyard/storage/chunk_store.hpp"
#include "chunkyard/storage/completion.hpp"
#include "chunkyard/storage/reassembler.hpp"
#include "chunkyard/storage/retention.hpp"
#include "chunkyard/storage/root_validator.hpp"
#include "chunkyard/storage/status_inspector.hpp"
#include "chunkyard/upload/lock_table.hpp"
#include "chunkyard/upload/types.hpp"

#include <chrono>
#include <istream>
#include <shared_mutex>

namespace chunkyard::upload {

/**
 * @brief Entry point for the three flow operations against one storage root
 *
 * upload_chunk runs "validate root → store chunk → check completion →
 * combine" as one unit per upload identifier, so two chunks of the same
 * upload never interleave with each other or with the combine. Uploads of
 * different identifiers proceed in parallel. cleanup waits for in-flight
 * uploads and status queries and blocks new ones while it runs.
 *
 * Coordination is in-process only: two processes sharing a root are not
 * protected from each other.
 */
class ChunkUploadService {
public:
    ChunkUploadService(core::StorageOptions options, events::EventBus& bus);

    /**
     * @brief Store one chunk and combine the upload if it is now complete
     *
     * @return Receipt whose final_path is set when this chunk completed the
     *         upload; an error if the root is unusable, the chunk could not
     *         be stored, or the combine failed
     */
    Result<ChunkReceipt> upload_chunk(const UploadDescriptor& descriptor, std::istream& payload);

    /**
     * @brief Report whether a chunk is already on disk with the right size
     */
    ChunkStatusReport chunk_status(const UploadDescriptor& descriptor);

    /**
     * @brief Remove uploads whose directories are older than max_age
     *
     * @return Number of upload directories removed
     */
    Result<std::size_t> cleanup(std::chrono::seconds max_age);

    Result<void> validate_root() { return validator_.validate(); }

    const std::filesystem::path& root() const { return options_.root; }

private:
    core::StorageOptions options_;
    events::EventBus& event_bus_;

    storage::StorageRootValidator validator_;
    storage::ChunkStore chunk_store_;
    storage::CompletionOracle completion_;
    storage::Reassembler reassembler_;
    storage::StatusInspector inspector_;
    storage::RetentionSweeper sweeper_;

    UploadLockTable upload_locks_;
    std::shared_mutex sweep_mutex_;
};

} // namespace chunkyard::upload
