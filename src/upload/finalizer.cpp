#include "chunkup/upload/finalizer.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::upload {

Finalizer::Finalizer(store::UploadStore& store,
                     SessionManager& sessions,
                     ChunkRecorder& recorder,
                     remote::StorageAppendClient& storage,
                     CleanupWorker& cleanup)
    : store_(store)
    , sessions_(sessions)
    , recorder_(recorder)
    , storage_(storage)
    , cleanup_(cleanup) {
}

std::string Finalizer::storage_path_for(const UploadSession& session) {
    return session.owner_id + "/" + session.storage_file_name;
}

Result<FinalizeOutcome> Finalizer::finalize(const std::string& upload_id,
                                            const std::string& storage_file_name,
                                            const std::string& caller_id) {
    if (upload_id.empty()) {
        return Err<FinalizeOutcome>(Error::validation("uploadId is required"));
    }

    // A retry after the session was already cleaned up
    auto existing = store_.find_file_by_upload(upload_id);
    if (existing.is_error()) {
        return Err<FinalizeOutcome>(existing.error());
    }
    if (existing.value() && existing.value()->owner_id == caller_id) {
        FileRecord& record = *existing.value();
        if (!storage_file_name.empty() && record.storage_path != caller_id + "/" + storage_file_name) {
            return Err<FinalizeOutcome>(Error::validation("storageFileName does not match the upload session"));
        }
        return Ok(FinalizeOutcome{std::move(record), false});
    }

    auto active = sessions_.require_active(upload_id, caller_id);
    if (active.is_error()) {
        return Err<FinalizeOutcome>(active.error());
    }
    const UploadSession& session = active.value();

    if (!storage_file_name.empty() && storage_file_name != session.storage_file_name) {
        return Err<FinalizeOutcome>(Error::validation("storageFileName does not match the upload session"));
    }

    auto progress = recorder_.get_progress(upload_id);
    if (progress.is_error()) {
        return Err<FinalizeOutcome>(progress.error());
    }
    if (!progress.value().is_complete) {
        auto missing = ChunkRecorder::missing_indices(progress.value());
        const auto missing_count = missing.size();
        return Err<FinalizeOutcome>(Error::incomplete(
            "Upload incomplete: " + std::to_string(missing_count) + " of " +
            std::to_string(session.total_chunks) + " chunks missing",
            std::move(missing)));
    }

    auto verified = storage_.verify(session.storage_file_name, session.owner_id, session.total_size_bytes);
    if (verified.is_error()) {
        return Err<FinalizeOutcome>(verified.error());
    }
    if (!verified.value().exists) {
        spdlog::error("Upload {} is complete in the ledger but {} is missing on the storage node",
                      upload_id, session.storage_file_name);
        return Err<FinalizeOutcome>(Error{ErrorCode::RemoteFileMissing,
            "File not found on storage node; upload must be restarted"});
    }
    if (verified.value().size != session.total_size_bytes) {
        spdlog::error("Upload {} size mismatch: node has {} bytes, expected {}",
                      upload_id, verified.value().size, session.total_size_bytes);
        return Err<FinalizeOutcome>(Error{ErrorCode::IntegrityMismatch,
            "Stored size " + std::to_string(verified.value().size) +
            " does not match declared size " + std::to_string(session.total_size_bytes)});
    }

    FileRecord record;
    record.owner_id = session.owner_id;
    record.folder_id = session.folder_id;
    record.name = session.file_name;
    record.original_name = session.file_name;
    record.mime_type = session.mime_type;
    record.size_bytes = verified.value().size;
    record.storage_path = storage_path_for(session);
    record.upload_id = session.upload_id;
    record.created_at = sessions_.now();

    auto committed = store_.insert_file_record(record);
    if (committed.is_error()) {
        return Err<FinalizeOutcome>(committed.error());
    }

    auto& [file, created] = committed.value();
    if (created) {
        spdlog::info("Finalized upload {} as {} ({} bytes)", upload_id, file.storage_path, file.size_bytes);
    }

    // Cleanup failure never reverts the record
    if (!cleanup_.enqueue(upload_id)) {
        spdlog::warn("Could not schedule cleanup for upload {}", upload_id);
    }

    return Ok(FinalizeOutcome{std::move(file), created});
}

} // namespace chunkup::upload
