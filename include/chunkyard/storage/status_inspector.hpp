#pragma once

#include "chunkyard/storage/root_validator.hpp"
#include "chunkyard/upload/types.hpp"

namespace chunkyard::storage {

/**
 * @brief Read-only answer to "has chunk N of upload U arrived intact?"
 *
 * Used by clients polling before they (re)send a chunk. Never writes.
 */
class StatusInspector {
public:
    explicit StatusInspector(StorageRootValidator& validator) : validator_(validator) {}

    upload::ChunkStatusReport status(const upload::UploadDescriptor& descriptor) const;

private:
    StorageRootValidator& validator_;
};

} // namespace chunkyard::storage
