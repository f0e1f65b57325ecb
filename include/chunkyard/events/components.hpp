/**
 * @file components.hpp
 * @brief Observers that turn upload events into log lines and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "chunkyard/events/event_bus.hpp"
#include "chunkyard/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace chunkyard::events {

/**
 * @brief Logs every upload and server event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            on_chunk_stored(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });

        bus_.subscribe<SweepCompletedEvent>([this](const SweepCompletedEvent& e) {
            on_sweep_completed(e);
        });

        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });
    }

private:
    void on_chunk_stored(const ChunkStoredEvent& e) {
        spdlog::debug("[ChunkStored] id={} chunk={}/{} bytes={}",
                      e.identifier, e.chunk_number, e.total_chunks, e.bytes);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] id={} path={} bytes={}", e.identifier, e.final_path, e.total_bytes);
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::warn("[UploadFailed] id={} stage={} error={}", e.identifier, e.stage, e.error_message);
    }

    void on_sweep_completed(const SweepCompletedEvent& e) {
        if (e.error_message.empty()) {
            spdlog::info("[SweepCompleted] removed={} max_age={}s", e.removed, e.max_age.count());
        } else {
            spdlog::error("[SweepFailed] max_age={}s error={}", e.max_age.count(), e.error_message);
        }
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Upload server started on port {}", e.port);
        spdlog::info("Storage root: {}", e.storage_root);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Counts upload activity for the /api/stats endpoint
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> chunks_stored{0};
        std::atomic<std::uint64_t> bytes_stored{0};
        std::atomic<std::uint64_t> uploads_completed{0};
        std::atomic<std::uint64_t> bytes_completed{0};
        std::atomic<std::uint64_t> failures{0};
        std::atomic<std::uint64_t> sweeps{0};
        std::atomic<std::uint64_t> uploads_swept{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            stats_.chunks_stored++;
            stats_.bytes_stored += e.bytes;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_completed += e.total_bytes;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.failures++;
        });

        bus_.subscribe<SweepCompletedEvent>([this](const SweepCompletedEvent& e) {
            stats_.sweeps++;
            stats_.uploads_swept += e.removed;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Chunks stored:     {}", stats_.chunks_stored.load());
        spdlog::info("  Bytes stored:      {}", stats_.bytes_stored.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Bytes completed:   {}", stats_.bytes_completed.load());
        spdlog::info("  Failures:          {}", stats_.failures.load());
        spdlog::info("  Sweeps:            {}", stats_.sweeps.load());
        spdlog::info("  Uploads swept:     {}", stats_.uploads_swept.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace chunkyard::events
