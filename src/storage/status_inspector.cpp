#include "chunkyard/storage/status_inspector.hpp"
#include "chunkyard/storage/filesystem.hpp"

namespace chunkyard::storage {

using upload::ChunkStatusCode;
using upload::ChunkStatusReport;

namespace {

ChunkStatusReport report(ChunkStatusCode code, std::string message) {
    ChunkStatusReport out;
    out.message = std::move(message);
    out.status_code = static_cast<int>(code);
    return out;
}

} // namespace

ChunkStatusReport StatusInspector::status(const upload::UploadDescriptor& descriptor) const {
    auto valid = validator_.validate();
    if (valid.is_error()) {
        return report(ChunkStatusCode::InternalError, "Directory is broken: " + valid.error().message);
    }

    const auto paths = upload::make_upload_paths(validator_.root(), descriptor);
    const std::string label = "The chunk " + descriptor.identifier + ":" + std::to_string(descriptor.chunk_number);

    auto contents = read_file(paths.chunk_path);
    if (contents.is_error()) {
        return report(ChunkStatusCode::NotYetReceived, label + " isn't started yet!");
    }

    // The final chunk may be anything up to twice the nominal size
    if (!descriptor.is_final_chunk() && contents.value().size() != descriptor.chunk_size) {
        return report(ChunkStatusCode::InternalError, label + " is the wrong size!");
    }

    return report(ChunkStatusCode::Ok, label + " looks great!");
}

} // namespace chunkyard::storage
