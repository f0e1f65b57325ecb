#include "chunkyard/upload/service.hpp"
#include "chunkyard/upload/descriptor.hpp"
#include "chunkyard/events/events.hpp"

#include <spdlog/spdlog.h>

namespace chunkyard::upload {
namespace fs = std::filesystem;

ChunkUploadService::ChunkUploadService(core::StorageOptions options, events::EventBus& bus)
    : options_(std::move(options)),
      event_bus_(bus),
      validator_(options_),
      chunk_store_(options_),
      reassembler_(options_),
      inspector_(validator_) {
}

Result<ChunkReceipt> ChunkUploadService::upload_chunk(const UploadDescriptor& descriptor, std::istream& payload) {
    if (auto checked = validate_descriptor(descriptor); checked.is_error()) {
        event_bus_.emit(events::UploadFailedEvent{descriptor.identifier, "decode", checked.error().message});
        return Err<ChunkReceipt>(checked.error());
    }

    if (auto valid = validator_.validate(); valid.is_error()) {
        event_bus_.emit(events::UploadFailedEvent{descriptor.identifier, "validate", valid.error().message});
        return Err<ChunkReceipt>(valid.error());
    }

    std::shared_lock sweep_lock(sweep_mutex_);
    auto guard = upload_locks_.acquire(descriptor.identifier);

    const auto paths = make_upload_paths(options_.root, descriptor);

    auto stored = chunk_store_.store(paths.upload_dir, paths.chunk_path, descriptor, payload);
    if (stored.is_error()) {
        event_bus_.emit(events::UploadFailedEvent{descriptor.identifier, "store", stored.error().message});
        return Err<ChunkReceipt>(stored.error());
    }

    ChunkReceipt receipt;
    receipt.chunk_number = descriptor.chunk_number;
    receipt.bytes_written = stored.value();
    event_bus_.emit(events::ChunkStoredEvent{descriptor.identifier, descriptor.chunk_number,
                                             descriptor.total_chunks, stored.value()});

    if (!completion_.is_complete(paths.upload_dir, descriptor.total_size)) {
        return Ok(receipt);
    }

    auto combined = reassembler_.combine(paths.upload_dir, descriptor);
    if (combined.is_error()) {
        event_bus_.emit(events::UploadFailedEvent{descriptor.identifier, "combine", combined.error().message});
        return Err<ChunkReceipt>(combined.error());
    }

    receipt.final_path = combined.value();
    event_bus_.emit(events::UploadCompletedEvent{descriptor.identifier, combined.value().string(),
                                                 descriptor.total_size});
    return Ok(receipt);
}

ChunkStatusReport ChunkUploadService::chunk_status(const UploadDescriptor& descriptor) {
    if (auto checked = validate_descriptor(descriptor); checked.is_error()) {
        spdlog::warn("Status query for {} rejected: {}", descriptor.identifier, checked.error().message);
        return ChunkStatusReport{checked.error().message, static_cast<int>(ChunkStatusCode::InternalError)};
    }

    std::shared_lock sweep_lock(sweep_mutex_);
    return inspector_.status(descriptor);
}

Result<std::size_t> ChunkUploadService::cleanup(std::chrono::seconds max_age) {
    std::unique_lock sweep_lock(sweep_mutex_);

    auto swept = sweeper_.sweep(options_.root, max_age);
    events::SweepCompletedEvent event;
    event.max_age = max_age;
    if (swept.is_error()) {
        event.error_message = swept.error().message;
    } else {
        event.removed = swept.value();
    }
    event_bus_.emit(event);
    return swept;
}

} // namespace chunkyard::upload
