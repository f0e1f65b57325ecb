#pragma once

#include "chunkyard/core/config.hpp"
#include "chunkyard/core/result.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>

namespace chunkyard::storage {

/**
 * @brief One-shot health check of a storage root
 *
 * The first validate() call probes the root (create a nested directory,
 * write a file, read it back, delete the tree) and memoises the outcome.
 * Every later call returns that outcome without touching the filesystem,
 * so a root that becomes unwritable afterwards is not noticed, and a root
 * that was broken stays broken for the lifetime of this object.
 *
 * Thread-safe: concurrent first callers block until the single probe
 * finishes.
 */
class StorageRootValidator {
public:
    static constexpr const char* kProbeDirectory = "5d58061677944334bb616ba19cec5cc4";
    static constexpr const char* kProbeChunk = "42";
    static constexpr const char* kProbeFile = "foobie";

    explicit StorageRootValidator(core::StorageOptions options);

    StorageRootValidator(const StorageRootValidator&) = delete;
    StorageRootValidator& operator=(const StorageRootValidator&) = delete;

    Result<void> validate();

    const std::filesystem::path& root() const { return options_.root; }
    const core::StorageOptions& options() const { return options_; }

    /// Number of times the filesystem probe actually ran (0 or 1)
    int probe_count() const { return probe_count_.load(); }

private:
    Result<void> probe();

    core::StorageOptions options_;
    std::once_flag once_;
    std::optional<Error> cached_error_;
    std::atomic<int> probe_count_{0};
};

} // namespace chunkyard::storage
