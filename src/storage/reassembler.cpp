#include "chunkyard/storage/reassembler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>

namespace chunkyard::storage {
namespace fs = std::filesystem;

namespace {

std::optional<std::uint64_t> chunk_index(const std::string& name) {
    if (name.empty() || name.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : name) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

struct Input {
    fs::path path;
    std::string name;
    std::optional<std::uint64_t> index;
};

bool consume_before(const Input& a, const Input& b) {
    if (a.index && b.index) {
        if (*a.index != *b.index) {
            return *a.index < *b.index;
        }
        return a.name < b.name;  // "7" and "007"
    }
    if (a.index || b.index) {
        return a.index.has_value();
    }
    return a.name < b.name;
}

Result<std::uint64_t> append_file(std::ofstream& output, const fs::path& source) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<std::uint64_t>(ErrorCode::CannotReadFile, "Failed to open chunk: " + source.string());
    }

    std::uint64_t copied = 0;

    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        output.write(buffer, input.gcount());
        if (!output) {
            return Err<std::uint64_t>(ErrorCode::CannotWriteFile,
                                      "Failed to append " + source.string() + " to combined file");
        }
        copied += static_cast<std::uint64_t>(input.gcount());
    }
    if (input.bad()) {
        return Err<std::uint64_t>(ErrorCode::CannotReadFile, "Failed to read chunk: " + source.string());
    }
    return Ok(copied);
}

} // namespace

Result<std::vector<fs::path>> Reassembler::ordered_inputs(const fs::path& upload_dir,
                                                          const std::string& destination_name) {
    std::error_code ec;
    fs::directory_iterator it(upload_dir, ec);
    if (ec) {
        return Err<std::vector<fs::path>>(ErrorCode::CannotReadFile,
                                          "Failed to list " + upload_dir.string() + ": " + ec.message());
    }

    std::vector<Input> inputs;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name == destination_name) {
            continue;
        }
        inputs.push_back(Input{it->path(), name, chunk_index(name)});
    }
    if (ec) {
        return Err<std::vector<fs::path>>(ErrorCode::CannotReadFile,
                                          "Failed to list " + upload_dir.string() + ": " + ec.message());
    }

    std::sort(inputs.begin(), inputs.end(), consume_before);

    std::vector<fs::path> ordered;
    ordered.reserve(inputs.size());
    for (auto& input : inputs) {
        ordered.push_back(std::move(input.path));
    }
    return Ok(ordered);
}

Result<fs::path> Reassembler::combine(const fs::path& upload_dir,
                                      const upload::UploadDescriptor& descriptor) const {
    const fs::path destination = upload_dir / descriptor.filename;

    // A numeric filename would be the path of one of the chunks
    if (chunk_index(descriptor.filename)) {
        return Err<fs::path>(ErrorCode::InvalidDescriptor,
                             "Combined file name collides with a chunk index: " + descriptor.filename);
    }

    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<fs::path>(ErrorCode::CannotWriteFile, "Failed to create combined file: " + destination.string());
    }

    std::error_code ec;
    fs::permissions(destination, options_.file_mode, fs::perm_options::replace, ec);
    if (ec) {
        return Err<fs::path>(ErrorCode::CannotWriteFile,
                             "Failed to set permissions on " + destination.string() + ": " + ec.message());
    }

    auto inputs = ordered_inputs(upload_dir, descriptor.filename);
    if (inputs.is_error()) {
        return Err<fs::path>(inputs.error());
    }

    std::uint64_t combined_size = 0;
    for (const auto& source : inputs.value()) {
        auto copied = append_file(output, source);
        if (copied.is_error()) {
            return Err<fs::path>(copied.error());
        }
        combined_size += copied.value();
        fs::remove(source, ec);
        if (ec) {
            return Err<fs::path>(ErrorCode::CannotDelete,
                                 "Failed to remove consumed chunk " + source.string() + ": " + ec.message());
        }
        spdlog::debug("Appended {} to {}", source.filename().string(), destination.string());
    }

    output.close();
    if (!output) {
        return Err<fs::path>(ErrorCode::CannotWriteFile, "Failed to close combined file: " + destination.string());
    }

    if (combined_size != descriptor.total_size) {
        return Err<fs::path>(ErrorCode::IoError,
                             "Combined file " + destination.string() + " holds " + std::to_string(combined_size) +
                                 " bytes, expected " + std::to_string(descriptor.total_size));
    }

    fs::path absolute = fs::absolute(destination, ec);
    if (ec) {
        absolute = destination;
    }
    spdlog::info("Combined {} chunk(s) of {} into {}", inputs.value().size(), descriptor.identifier,
                 absolute.string());
    return Ok(absolute);
}

} // namespace chunkyard::storage
