/**
 * @file events.hpp
 * @brief Event types emitted by the upload service and the server
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkStoredEvent, UploadCompletedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkyard::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief A chunk payload reached its final location on disk
 *
 * WHO EMITS: ChunkUploadService::upload_chunk
 * WHO SUBSCRIBES: LoggerComponent (debug line), MetricsComponent
 */
struct ChunkStoredEvent {
    std::string identifier;
    std::uint64_t chunk_number = 0;
    std::uint64_t total_chunks = 0;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief All chunks were combined into the final file
 */
struct UploadCompletedEvent {
    std::string identifier;
    std::string final_path;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Storing or combining failed
 *
 * stage is "validate", "store" or "combine".
 */
struct UploadFailedEvent {
    std::string identifier;
    std::string stage;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A retention sweep finished
 *
 * error_message is empty on success; on failure removed counts nothing.
 */
struct SweepCompletedEvent {
    std::size_t removed = 0;
    std::chrono::seconds max_age{0};
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::uint16_t port;
    std::string storage_root;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(std::uint16_t p, std::string root)
        : port(p),
          storage_root(std::move(root)),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace chunkyard::events
