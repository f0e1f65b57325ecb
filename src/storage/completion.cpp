#include "chunkyard/storage/completion.hpp"

#include <spdlog/spdlog.h>

namespace chunkyard::storage {
namespace fs = std::filesystem;

std::uint64_t CompletionOracle::received_bytes(const fs::path& upload_dir) const {
    std::error_code ec;
    fs::directory_iterator it(upload_dir, ec);
    if (ec) {
        spdlog::warn("Cannot list {}: {}", upload_dir.string(), ec.message());
        return 0;
    }

    std::uint64_t total = 0;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        const auto size = fs::file_size(it->path(), ec);
        if (ec) {
            spdlog::warn("Cannot stat {}: {}", it->path().string(), ec.message());
            ec.clear();
            continue;
        }
        total += size;
    }
    if (ec) {
        spdlog::warn("Listing {} stopped early: {}", upload_dir.string(), ec.message());
    }
    return total;
}

} // namespace chunkyard::storage
