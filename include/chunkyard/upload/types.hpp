#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkyard::upload {

/**
 * @brief Per-request description of one chunk of a flow upload
 *
 * Built once at the boundary (see parse_descriptor) and never mutated.
 */
struct UploadDescriptor {
    std::uint64_t chunk_number = 0;  ///< 1-based index of this chunk
    std::uint64_t total_chunks = 0;
    std::uint64_t chunk_size = 0;    ///< Nominal chunk size; the last chunk may be up to 2x
    std::uint64_t total_size = 0;
    std::string identifier;          ///< Names the per-upload directory
    std::string filename;            ///< Name of the combined file
    std::string relative_path;       ///< Accepted, not used for placement

    bool is_final_chunk() const { return chunk_number == total_chunks; }
};

/**
 * @brief Status codes returned by a chunk status query
 *
 * NotYetReceived deliberately avoids 200/201/202/404/415/500/501, which flow
 * clients interpret as success or permanent failure; any other code makes
 * them keep polling.
 */
enum class ChunkStatusCode {
    Ok = 200,
    NotYetReceived = 406,
    InternalError = 500
};

struct ChunkStatusReport {
    std::string message;
    int status_code = static_cast<int>(ChunkStatusCode::Ok);

    ChunkStatusCode code() const { return static_cast<ChunkStatusCode>(status_code); }
};

/**
 * @brief Outcome of storing one chunk
 *
 * final_path is set only by the request that completed the upload.
 */
struct ChunkReceipt {
    std::uint64_t chunk_number = 0;
    std::uint64_t bytes_written = 0;
    std::optional<std::filesystem::path> final_path;

    bool completed() const { return final_path.has_value(); }
};

/**
 * @brief On-disk locations derived from a descriptor
 */
struct UploadPaths {
    std::filesystem::path upload_dir;  ///< root/<identifier>
    std::filesystem::path chunk_path;  ///< root/<identifier>/<chunk_number>
};

inline UploadPaths make_upload_paths(const std::filesystem::path& root, const UploadDescriptor& descriptor) {
    UploadPaths paths;
    paths.upload_dir = root / descriptor.identifier;
    paths.chunk_path = paths.upload_dir / std::to_string(descriptor.chunk_number);
    return paths;
}

} // namespace chunkyard::upload
