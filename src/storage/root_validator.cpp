#include "chunkyard/storage/root_validator.hpp"
#include "chunkyard/storage/filesystem.hpp"

#include <spdlog/spdlog.h>

namespace chunkyard::storage {
namespace fs = std::filesystem;

namespace {

const char* const kProbeContent =
    "For instance, on the planet Earth, man had always assumed that he was more intelligent than\n"
    "dolphins because he had achieved so much, the wheel, New York, wars and so on, whilst all the\n"
    "dolphins had ever done was muck about in the water having a good time. But conversely, the\n"
    "dolphins had always believed that they were far more intelligent than man, for precisely the\n"
    "same reasons.";

bool same_directory(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    const bool equal = fs::equivalent(a, b, ec);
    return !ec && equal;
}

} // namespace

StorageRootValidator::StorageRootValidator(core::StorageOptions options)
    : options_(std::move(options)) {
}

Result<void> StorageRootValidator::validate() {
    std::call_once(once_, [this] {
        auto outcome = probe();
        if (outcome.is_error()) {
            cached_error_ = outcome.error();
            spdlog::error("Storage root {} failed validation: {}", options_.root.string(),
                          outcome.error().message);
        } else {
            spdlog::info("Storage root {} validated", options_.root.string());
        }
    });

    if (cached_error_) {
        return Err<void>(*cached_error_);
    }
    return Ok();
}

Result<void> StorageRootValidator::probe() {
    probe_count_.fetch_add(1);

    std::error_code ec;
    if (!fs::is_directory(options_.root, ec)) {
        return Err<void>(root_error(ErrorCode::NoRootDirectory));
    }

    const fs::path probe_root = options_.root / kProbeDirectory;
    const fs::path probe_dir = probe_root / kProbeChunk;
    if (ensure_directory(probe_dir, options_.directory_mode).is_error()) {
        return Err<void>(root_error(ErrorCode::CannotCreateDirectory));
    }

    const fs::path probe_file = probe_dir / kProbeFile;
    if (write_file(probe_file, kProbeContent, options_.file_mode).is_error()) {
        return Err<void>(root_error(ErrorCode::CannotWriteFile));
    }

    auto contents = read_file(probe_file);
    if (contents.is_error()) {
        return Err<void>(root_error(ErrorCode::CannotReadFile));
    }
    if (contents.value() != kProbeContent) {
        return Err<void>(Error{ErrorCode::CannotReadFile,
                               "chunkyard: read back different bytes than were written under the storage root"});
    }

    fs::remove_all(probe_root, ec);
    if (ec) {
        return Err<void>(root_error(ErrorCode::CannotDelete));
    }

    if (same_directory(options_.root, fs::temp_directory_path(ec))) {
        spdlog::warn("Storage root {} is the system temp directory; it works, but consider a dedicated "
                     "subdirectory for upload chunks", options_.root.string());
    }

    return Ok();
}

} // namespace chunkyard::storage
