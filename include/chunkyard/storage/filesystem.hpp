#pragma once

#include "chunkyard/core/result.hpp"

#include <filesystem>
#include <string>

namespace chunkyard::storage {

/**
 * @brief Create dir and every missing parent, applying mode to the ones created
 *
 * Existing directories keep their permissions. Fails with
 * ErrorCode::CannotCreateDirectory, or when dir exists as a non-directory.
 */
Result<void> ensure_directory(const std::filesystem::path& dir, std::filesystem::perms mode);

/**
 * @brief Read a whole file into memory (ErrorCode::CannotReadFile on failure)
 */
Result<std::string> read_file(const std::filesystem::path& path);

/**
 * @brief Create or truncate path, write data, then apply mode
 */
Result<void> write_file(const std::filesystem::path& path,
                        const std::string& data,
                        std::filesystem::perms mode);

/**
 * @brief Write data next to path and rename it into place
 *
 * Readers see either the previous file or the complete new one. The
 * temporary sibling is removed if any step fails.
 */
Result<void> replace_file(const std::filesystem::path& path,
                          const std::string& data,
                          std::filesystem::perms mode);

} // namespace chunkyard::storage
