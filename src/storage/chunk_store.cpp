#include "chunkyard/storage/chunk_store.hpp"
#include "chunkyard/storage/filesystem.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace chunkyard::storage {
namespace fs = std::filesystem;

Result<std::uint64_t> ChunkStore::store(const fs::path& upload_dir,
                                        const fs::path& chunk_path,
                                        const upload::UploadDescriptor& descriptor,
                                        std::istream& payload) const {
    if (auto res = ensure_directory(upload_dir, options_.directory_mode); res.is_error()) {
        return Err<std::uint64_t>(ErrorCode::CannotWriteFile,
                                  "Unable to store chunk: bad directory: " + res.error().message);
    }

    std::ostringstream buffer;
    buffer << payload.rdbuf();
    if (payload.bad()) {
        return Err<std::uint64_t>(ErrorCode::CannotWriteFile, "Unable to store chunk: can't read payload");
    }
    const std::string data = buffer.str();

    if (auto res = replace_file(chunk_path, data, options_.file_mode); res.is_error()) {
        return Err<std::uint64_t>(ErrorCode::CannotWriteFile,
                                  "Unable to store chunk: " + res.error().message);
    }

    spdlog::debug("Stored chunk {}/{} of {} ({} bytes)", descriptor.chunk_number, descriptor.total_chunks,
                  descriptor.identifier, data.size());
    return Ok(static_cast<std::uint64_t>(data.size()));
}

} // namespace chunkyard::storage
