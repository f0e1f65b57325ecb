#include "chunkyard/storage/filesystem.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <vector>

namespace chunkyard::storage {
namespace fs = std::filesystem;

namespace {

fs::path temporary_sibling(const fs::path& path) {
    static std::atomic<std::uint64_t> counter{0};
    return path.parent_path() /
           ("." + path.filename().string() + ".tmp-" + std::to_string(counter.fetch_add(1)));
}

} // namespace

Result<void> ensure_directory(const fs::path& dir, fs::perms mode) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return Ok();
    }

    // Walk up to the deepest existing ancestor, then create downwards
    std::vector<fs::path> missing;
    for (fs::path current = dir; !current.empty(); current = current.parent_path()) {
        if (fs::exists(current, ec)) {
            break;
        }
        missing.push_back(current);
        if (current == current.parent_path()) {
            break;
        }
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        fs::create_directory(*it, ec);
        if (ec && !fs::is_directory(*it)) {
            return Err<void>(Error{ErrorCode::CannotCreateDirectory,
                                   "Failed to create directory " + it->string() + ": " + ec.message()});
        }
        fs::permissions(*it, mode, fs::perm_options::replace, ec);
        if (ec) {
            return Err<void>(Error{ErrorCode::CannotCreateDirectory,
                                   "Failed to set permissions on " + it->string() + ": " + ec.message()});
        }
    }

    if (!fs::is_directory(dir, ec)) {
        return Err<void>(Error{ErrorCode::CannotCreateDirectory, "Not a directory: " + dir.string()});
    }
    return Ok();
}

Result<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::string>(ErrorCode::CannotReadFile, "Not a readable file: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::CannotReadFile, "Failed to open file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return Err<std::string>(ErrorCode::CannotReadFile, "Failed to read file: " + path.string());
    }
    return Ok(buffer.str());
}

Result<void> write_file(const fs::path& path, const std::string& data, fs::perms mode) {
    {
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(Error{ErrorCode::CannotWriteFile, "Failed to create file: " + path.string()});
        }
        output.write(data.data(), static_cast<std::streamsize>(data.size()));
        output.flush();
        if (!output) {
            return Err<void>(Error{ErrorCode::CannotWriteFile, "Failed to write file: " + path.string()});
        }
    }

    std::error_code ec;
    fs::permissions(path, mode, fs::perm_options::replace, ec);
    if (ec) {
        return Err<void>(Error{ErrorCode::CannotWriteFile,
                               "Failed to set permissions on " + path.string() + ": " + ec.message()});
    }
    return Ok();
}

Result<void> replace_file(const fs::path& path, const std::string& data, fs::perms mode) {
    const fs::path temporary = temporary_sibling(path);

    auto written = write_file(temporary, data, mode);
    std::error_code ec;
    if (written.is_error()) {
        fs::remove(temporary, ec);
        return written;
    }

    fs::rename(temporary, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(temporary, ec);
        return Err<void>(Error{ErrorCode::CannotWriteFile,
                               "Failed to move chunk into place at " + path.string() + ": " + reason});
    }
    return Ok();
}

} // namespace chunkyard::storage
