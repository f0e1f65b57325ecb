#include "chunkyard/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace chunkyard::core {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<fs::perms> read_mode(const json& value, const std::string& key) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > 07777) {
            return Err<fs::perms>(ErrorCode::InvalidConfig, key + " out of range");
        }
        return Ok(static_cast<fs::perms>(raw));
    }
    if (value.is_string()) {
        auto parsed = parse_mode(value.get<std::string>());
        if (parsed.is_error()) {
            return Err<fs::perms>(ErrorCode::InvalidConfig, key + ": " + parsed.error().message);
        }
        return parsed;
    }
    return Err<fs::perms>(ErrorCode::InvalidConfig, key + " must be a number or an octal string");
}

Result<std::chrono::seconds> read_seconds(const json& value, const std::string& key) {
    if (!value.is_number_unsigned()) {
        return Err<std::chrono::seconds>(ErrorCode::InvalidConfig, key + " must be a non-negative integer");
    }
    return Ok(std::chrono::seconds(value.get<std::int64_t>()));
}

} // namespace

Result<fs::perms> parse_mode(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return Err<fs::perms>(ErrorCode::InvalidConfig, "invalid mode '" + text + "'");
    }
    unsigned value = 0;
    for (char c : text) {
        if (c < '0' || c > '7') {
            return Err<fs::perms>(ErrorCode::InvalidConfig, "invalid mode '" + text + "'");
        }
        value = value * 8 + static_cast<unsigned>(c - '0');
    }
    if (value > 07777) {
        return Err<fs::perms>(ErrorCode::InvalidConfig, "invalid mode '" + text + "'");
    }
    return Ok(static_cast<fs::perms>(value));
}

Result<ServerConfig> parse_config(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<ServerConfig>(ErrorCode::InvalidConfig, "Invalid JSON");
    }
    if (!doc.is_object()) {
        return Err<ServerConfig>(ErrorCode::InvalidConfig, "configuration must be a JSON object");
    }

    ServerConfig config;

    if (auto it = doc.find("storage_root"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            return Err<ServerConfig>(ErrorCode::InvalidConfig, "storage_root must be a non-empty string");
        }
        config.storage.root = fs::path(it->get<std::string>());
    }

    if (auto it = doc.find("port"); it != doc.end()) {
        if (!it->is_number_unsigned() || it->get<std::uint64_t>() > 65535) {
            return Err<ServerConfig>(ErrorCode::InvalidConfig, "port must be between 0 and 65535");
        }
        config.port = static_cast<std::uint16_t>(it->get<std::uint64_t>());
    }

    if (auto it = doc.find("directory_mode"); it != doc.end()) {
        auto mode = read_mode(*it, "directory_mode");
        if (mode.is_error()) {
            return Err<ServerConfig>(mode.error());
        }
        config.storage.directory_mode = mode.value();
    }

    if (auto it = doc.find("file_mode"); it != doc.end()) {
        auto mode = read_mode(*it, "file_mode");
        if (mode.is_error()) {
            return Err<ServerConfig>(mode.error());
        }
        config.storage.file_mode = mode.value();
    }

    if (auto it = doc.find("retention_seconds"); it != doc.end()) {
        auto seconds = read_seconds(*it, "retention_seconds");
        if (seconds.is_error()) {
            return Err<ServerConfig>(seconds.error());
        }
        config.retention = seconds.value();
    }

    if (auto it = doc.find("sweep_interval_seconds"); it != doc.end()) {
        auto seconds = read_seconds(*it, "sweep_interval_seconds");
        if (seconds.is_error()) {
            return Err<ServerConfig>(seconds.error());
        }
        config.sweep_interval = seconds.value();
    }

    if (auto it = doc.find("log_level"); it != doc.end()) {
        if (!it->is_string()) {
            return Err<ServerConfig>(ErrorCode::InvalidConfig, "log_level must be a string");
        }
        const auto level = it->get<std::string>();
        // from_str maps unknown names to off
        if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
            return Err<ServerConfig>(ErrorCode::InvalidConfig, "unknown log_level '" + level + "'");
        }
        config.log_level = level;
    }

    if (auto it = doc.find("upload_path"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>().empty() || it->get<std::string>().front() != '/') {
            return Err<ServerConfig>(ErrorCode::InvalidConfig, "upload_path must start with '/'");
        }
        config.upload_path = it->get<std::string>();
    }

    return Ok(config);
}

Result<ServerConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ServerConfig>(ErrorCode::InvalidConfig, "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace chunkyard::core
