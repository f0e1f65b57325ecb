#include "chunkyard/upload/descriptor.hpp"

#include <cctype>
#include <optional>

namespace chunkyard::upload {
namespace {

std::optional<std::uint64_t> parse_number(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

std::string field(const FieldMap& fields, const char* name) {
    auto it = fields.find(name);
    return it == fields.end() ? std::string() : it->second;
}

bool is_single_component(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

Result<UploadDescriptor> bad(const char* what) {
    return Err<UploadDescriptor>(ErrorCode::InvalidDescriptor, std::string("Bad ") + what);
}

} // namespace

Result<UploadDescriptor> parse_descriptor(const FieldMap& fields) {
    UploadDescriptor descriptor;

    auto chunk_number = parse_number(field(fields, kFieldChunkNumber));
    if (!chunk_number) {
        return bad("ChunkNumber");
    }
    descriptor.chunk_number = *chunk_number;

    auto total_chunks = parse_number(field(fields, kFieldTotalChunks));
    if (!total_chunks) {
        return bad("TotalChunks");
    }
    descriptor.total_chunks = *total_chunks;

    auto chunk_size = parse_number(field(fields, kFieldChunkSize));
    if (!chunk_size) {
        return bad("ChunkSize");
    }
    descriptor.chunk_size = *chunk_size;

    auto total_size = parse_number(field(fields, kFieldTotalSize));
    if (!total_size) {
        return bad("TotalSize");
    }
    descriptor.total_size = *total_size;

    descriptor.identifier = field(fields, kFieldIdentifier);
    descriptor.filename = field(fields, kFieldFilename);
    descriptor.relative_path = field(fields, kFieldRelativePath);

    auto valid = validate_descriptor(descriptor);
    if (valid.is_error()) {
        return Err<UploadDescriptor>(valid.error());
    }
    return Ok(descriptor);
}

Result<void> validate_descriptor(const UploadDescriptor& descriptor) {
    auto fail = [](const char* what) {
        return Err<void>(Error{ErrorCode::InvalidDescriptor, std::string("Bad ") + what});
    };

    if (descriptor.chunk_number < 1) {
        return fail("ChunkNumber");
    }
    if (descriptor.total_chunks < 1) {
        return fail("TotalChunks");
    }
    if (descriptor.chunk_size == 0) {
        return fail("ChunkSize");
    }
    if (!is_single_component(descriptor.identifier)) {
        return fail("Identifier");
    }
    // The combined file sits beside the chunks, which are named by index
    if (!is_single_component(descriptor.filename) || parse_number(descriptor.filename)) {
        return fail("Filename");
    }
    if (descriptor.relative_path.empty()) {
        return fail("RelativePath");
    }
    return Ok();
}

} // namespace chunkyard::upload
