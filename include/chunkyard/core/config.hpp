#pragma once

#include "chunkyard/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkyard::core {

/**
 * @brief Storage-engine settings shared by every core component
 *
 * directory_mode applies to every directory the engine creates (the probe
 * path included); file_mode to every chunk and combined file. Both are
 * applied exactly, independent of the process umask.
 */
struct StorageOptions {
    std::filesystem::path root;
    std::filesystem::perms directory_mode = static_cast<std::filesystem::perms>(0755);
    std::filesystem::perms file_mode = static_cast<std::filesystem::perms>(0600);
};

/**
 * @brief Everything the upload server needs at startup
 */
struct ServerConfig {
    StorageOptions storage{std::filesystem::path("flow_uploads")};
    std::uint16_t port = 8080;
    std::chrono::seconds retention{86400};
    std::chrono::seconds sweep_interval{3600};  ///< 0 disables the periodic sweep
    std::string log_level = "info";
    std::string upload_path = "/upload";
};

/**
 * @brief Load a server configuration from a JSON document
 *
 * Missing keys keep their defaults. Modes accept either a number or an octal
 * string such as "0750".
 */
Result<ServerConfig> parse_config(const std::string& json_text);

/**
 * @brief Read and parse a JSON configuration file
 */
Result<ServerConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Parse an octal permission string ("0644", "755")
 */
Result<std::filesystem::perms> parse_mode(const std::string& text);

} // namespace chunkyard::core
