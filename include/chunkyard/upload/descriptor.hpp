#pragma once

#include "chunkyard/core/result.hpp"
#include "chunkyard/upload/types.hpp"

#include <string>
#include <unordered_map>

namespace chunkyard::upload {

using FieldMap = std::unordered_map<std::string, std::string>;

// flow.js form field names
inline constexpr const char* kFieldChunkNumber = "flowChunkNumber";
inline constexpr const char* kFieldTotalChunks = "flowTotalChunks";
inline constexpr const char* kFieldChunkSize = "flowChunkSize";
inline constexpr const char* kFieldTotalSize = "flowTotalSize";
inline constexpr const char* kFieldIdentifier = "flowIdentifier";
inline constexpr const char* kFieldFilename = "flowFilename";
inline constexpr const char* kFieldRelativePath = "flowRelativePath";

/**
 * @brief Build an UploadDescriptor from decoded form fields
 *
 * Fields are checked in protocol order and the first problem is reported as
 * ErrorCode::InvalidDescriptor ("Bad ChunkNumber", "Bad Identifier", ...).
 * Identifier and filename must be a single path component.
 */
Result<UploadDescriptor> parse_descriptor(const FieldMap& fields);

/**
 * @brief Check an already-populated descriptor against the same rules
 */
Result<void> validate_descriptor(const UploadDescriptor& descriptor);

} // namespace chunkyard::upload
