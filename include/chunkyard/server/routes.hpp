#pragma once

#include "chunkyard/events/components.hpp"
#include "chunkyard/network/http_router.hpp"
#include "chunkyard/upload/service.hpp"

#include <string>

namespace chunkyard::server {

/// Multipart field carrying the chunk bytes
inline constexpr const char* kFileField = "file";

/**
 * @brief Install the flow.js endpoints on a router
 *
 * - GET  upload_path   chunk status query (200 / 406 / 500, message as body)
 * - POST upload_path   multipart chunk upload, JSON reply
 * - GET  /api/stats    MetricsComponent counters as JSON
 *
 * service and metrics must outlive the router.
 */
void register_upload_routes(network::HttpRouter& router,
                            upload::ChunkUploadService& service,
                            const events::MetricsComponent& metrics,
                            const std::string& upload_path);

} // namespace chunkyard::server
