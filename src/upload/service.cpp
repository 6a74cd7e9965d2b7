#include "chunkup/upload/service.hpp"

#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::upload {

UploadService::UploadService(SessionManager& sessions,
                             ChunkRecorder& recorder,
                             remote::StorageAppendClient& storage,
                             Finalizer& finalizer,
                             events::EventBus& bus)
    : sessions_(sessions)
    , recorder_(recorder)
    , storage_(storage)
    , finalizer_(finalizer)
    , bus_(bus) {
}

void UploadService::reject(const std::string& upload_id, const char* operation, const Error& error) {
    bus_.emit(events::UploadRejectedEvent{upload_id, operation, error.code, error.message});
}

Result<InitResponse> UploadService::init(const std::string& caller_id, const InitRequest& request) {
    auto response = sessions_.init(caller_id, request);
    if (response.is_error()) {
        reject("", "init", response.error());
        return response;
    }

    const auto& created = response.value();
    bus_.emit(events::UploadInitializedEvent{created.upload_id, caller_id, request.file_name,
                                             created.storage_file_name, request.total_size_bytes,
                                             created.total_chunks});
    return response;
}

Result<ChunkReceipt> UploadService::upload_chunk(const std::string& caller_id, const ChunkUpload& chunk) {
    auto fail = [&](const Error& error) {
        reject(chunk.upload_id, "chunk", error);
        return Err<ChunkReceipt>(error);
    };

    auto active = sessions_.require_active(chunk.upload_id, caller_id);
    if (active.is_error()) {
        return fail(active.error());
    }
    const UploadSession& session = active.value();

    if (chunk.chunk_index < 0 || chunk.chunk_index >= session.total_chunks) {
        return fail(Error::validation("chunkIndex " + std::to_string(chunk.chunk_index) +
                                      " outside [0, " + std::to_string(session.total_chunks) + ")"));
    }
    if (chunk.data.empty()) {
        return fail(Error::validation("Chunk payload is empty"));
    }
    if (!chunk.storage_file_name.empty() && chunk.storage_file_name != session.storage_file_name) {
        return fail(Error::validation("storageFileName does not match the upload session"));
    }

    auto recorded = recorder_.is_recorded(chunk.upload_id, chunk.chunk_index);
    if (recorded.is_error()) {
        return fail(recorded.error());
    }
    if (recorded.value()) {
        auto progress = recorder_.get_progress(chunk.upload_id);
        if (progress.is_error()) {
            return fail(progress.error());
        }
        bus_.emit(events::ChunkSkippedEvent{chunk.upload_id, chunk.chunk_index});

        ChunkReceipt receipt;
        receipt.chunk_index = chunk.chunk_index;
        receipt.progress = std::move(progress.value());
        receipt.skipped = true;
        return Ok(std::move(receipt));
    }

    auto appended = storage_.append_chunk(session.storage_file_name,
                                          session.owner_id,
                                          chunk.data,
                                          chunk.chunk_index,
                                          session.total_chunks,
                                          chunk.chunk_index == 0,
                                          chunk.chunk_index == session.total_chunks - 1);
    if (appended.is_error()) {
        return fail(appended.error());
    }

    auto outcome = recorder_.record_chunk(chunk.upload_id, chunk.chunk_index);
    if (outcome.is_error()) {
        // Bytes are on the node but not in the ledger; a retry re-sends them at the same offset
        spdlog::error("Chunk {} of {} appended but not recorded: {}",
                      chunk.chunk_index, chunk.upload_id, outcome.error().message);
        return fail(outcome.error());
    }

    const auto& progress = outcome.value().progress;
    const bool newly_recorded = outcome.value().newly_recorded;
    if (newly_recorded) {
        bus_.emit(events::ChunkAppendedEvent{chunk.upload_id, chunk.chunk_index,
                                             static_cast<std::uint64_t>(chunk.data.size()),
                                             progress.uploaded_count, progress.total_chunks,
                                             appended.value().current_size});
    } else {
        // A concurrent request for the same index recorded it first
        bus_.emit(events::ChunkSkippedEvent{chunk.upload_id, chunk.chunk_index});
    }

    ChunkReceipt receipt;
    receipt.chunk_index = chunk.chunk_index;
    receipt.progress = progress;
    receipt.skipped = !newly_recorded;
    receipt.current_remote_size = appended.value().current_size;
    return Ok(std::move(receipt));
}

Result<SessionStatus> UploadService::status(const std::string& caller_id, const std::string& upload_id) {
    auto status = sessions_.status(upload_id, caller_id);
    if (status.is_error()) {
        reject(upload_id, "status", status.error());
    }
    return status;
}

Result<FileRecord> UploadService::finalize(const std::string& caller_id,
                                           const std::string& upload_id,
                                           const std::string& storage_file_name) {
    auto outcome = finalizer_.finalize(upload_id, storage_file_name, caller_id);
    if (outcome.is_error()) {
        reject(upload_id, "finalize", outcome.error());
        return Err<FileRecord>(outcome.error());
    }

    auto& result = outcome.value();
    bus_.emit(events::UploadFinalizedEvent{upload_id, result.record.storage_path,
                                           result.record.size_bytes, result.newly_created});
    return Ok(std::move(result.record));
}

Result<void> UploadService::cancel(const std::string& caller_id, const std::string& upload_id) {
    auto cancelled = sessions_.cancel(upload_id, caller_id);
    if (cancelled.is_error()) {
        reject(upload_id, "cancel", cancelled.error());
        return cancelled;
    }
    bus_.emit(events::UploadCancelledEvent{upload_id, caller_id});
    return cancelled;
}

Result<std::size_t> UploadService::purge_expired() {
    auto removed = sessions_.purge_expired();
    if (removed.is_error()) {
        spdlog::error("Expiry sweep failed: {}", removed.error().message);
        return Err<std::size_t>(removed.error());
    }

    const std::size_t count = removed.value().size();
    if (count > 0) {
        bus_.emit(events::SessionsExpiredEvent{std::move(removed.value())});
    }
    return Ok(count);
}

} // namespace chunkup::upload
