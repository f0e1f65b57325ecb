#include "chunkyard/storage/retention.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace chunkyard::storage {
namespace fs = std::filesystem;

Result<std::size_t> RetentionSweeper::sweep(const fs::path& root, std::chrono::seconds max_age) const {
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        return Err<std::size_t>(ErrorCode::IoError, "Failed to list " + root.string() + ": " + ec.message());
    }

    // Collect first: removing while iterating leaves the iterator unspecified
    std::vector<fs::path> children;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return Err<std::size_t>(ErrorCode::IoError, "Failed to list " + root.string() + ": " + ec.message());
    }

    const auto now = fs::file_time_type::clock::now();
    std::size_t removed = 0;

    for (const auto& child : children) {
        const auto modified = fs::last_write_time(child, ec);
        if (ec) {
            return Err<std::size_t>(ErrorCode::IoError, "Failed to stat " + child.string() + ": " + ec.message());
        }

        const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - modified);
        if (now - modified <= max_age) {
            spdlog::debug("Keeping {} (age {}s)", child.filename().string(), age.count());
            continue;
        }

        fs::remove_all(child, ec);
        if (ec) {
            return Err<std::size_t>(ErrorCode::CannotDelete,
                                    "Failed to remove " + child.string() + ": " + ec.message());
        }
        spdlog::info("Removed abandoned upload {} (age {}s)", child.filename().string(), age.count());
        ++removed;
    }

    return Ok(removed);
}

} // namespace chunkyard::storage
