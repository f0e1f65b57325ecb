#include "chunkyard/server/routes.hpp"
#include "chunkyard/network/form_data.hpp"
#include "chunkyard/upload/descriptor.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace chunkyard::server {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse text_response(int status, const std::string& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "text/plain");
    response.set_body(body);
    return response;
}

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

// Descriptor problems are permanent: 500 stops flow.js from retrying them
HttpResponse upload_error(const Error& error) {
    json body;
    body["status"] = "error";
    body["code"] = error_code_name(error.code);
    body["message"] = error.message;
    return json_response(HttpStatus::INTERNAL_SERVER_ERROR, body);
}

HttpResponse handle_status(upload::ChunkUploadService& service, const HttpContext& ctx) {
    auto descriptor = upload::parse_descriptor(ctx.query);
    if (descriptor.is_error()) {
        spdlog::warn("Status query rejected: {}", descriptor.error().message);
        return text_response(static_cast<int>(upload::ChunkStatusCode::InternalError),
                             descriptor.error().message);
    }

    const auto report = service.chunk_status(descriptor.value());
    return text_response(report.status_code, report.message);
}

HttpResponse handle_upload(upload::ChunkUploadService& service, const HttpContext& ctx) {
    auto form = network::parse_form(ctx.request);
    if (form.is_error()) {
        spdlog::warn("Upload body rejected: {}", form.error().message);
        return upload_error(form.error());
    }

    auto descriptor = upload::parse_descriptor(form.value().fields);
    if (descriptor.is_error()) {
        spdlog::warn("Upload rejected: {}", descriptor.error().message);
        return upload_error(descriptor.error());
    }

    const network::FilePart* part = form.value().file(kFileField);
    if (part == nullptr) {
        return upload_error(Error{ErrorCode::MalformedRequest,
                                  std::string("missing multipart field '") + kFileField + "'"});
    }

    std::istringstream payload(part->data);
    auto receipt = service.upload_chunk(descriptor.value(), payload);
    if (receipt.is_error()) {
        return upload_error(receipt.error());
    }

    json body;
    body["chunk"] = receipt.value().chunk_number;
    body["bytes"] = receipt.value().bytes_written;
    if (receipt.value().completed()) {
        body["status"] = "complete";
        body["path"] = receipt.value().final_path->string();
    } else {
        body["status"] = "stored";
    }
    return json_response(HttpStatus::OK, body);
}

json stats_to_json(const events::MetricsComponent::Stats& stats) {
    json body;
    body["chunks_stored"] = stats.chunks_stored.load();
    body["bytes_stored"] = stats.bytes_stored.load();
    body["uploads_completed"] = stats.uploads_completed.load();
    body["bytes_completed"] = stats.bytes_completed.load();
    body["failures"] = stats.failures.load();
    body["sweeps"] = stats.sweeps.load();
    body["uploads_swept"] = stats.uploads_swept.load();
    return body;
}

} // namespace

void register_upload_routes(network::HttpRouter& router,
                            upload::ChunkUploadService& service,
                            const events::MetricsComponent& metrics,
                            const std::string& upload_path) {
    router.get(upload_path, [&service](const HttpContext& ctx) {
        return handle_status(service, ctx);
    });

    router.post(upload_path, [&service](const HttpContext& ctx) {
        return handle_upload(service, ctx);
    });

    router.get("/api/stats", [&metrics](const HttpContext&) {
        return json_response(HttpStatus::OK, stats_to_json(metrics.get_stats()));
    });
}

} // namespace chunkyard::server
