#include "chunkup/upload/chunk_recorder.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::upload {

ChunkRecorder::ChunkRecorder(store::UploadStore& store)
    : store_(store) {
}

Result<RecordOutcome> ChunkRecorder::record_chunk(const std::string& upload_id, std::int32_t chunk_index) {
    auto session = store_.find_session(upload_id);
    if (session.is_error()) {
        return Err<RecordOutcome>(session.error());
    }
    if (!session.value()) {
        return Err<RecordOutcome>(Error::not_found("Upload session not found: " + upload_id));
    }

    const std::int32_t total_chunks = session.value()->total_chunks;
    if (chunk_index < 0 || chunk_index >= total_chunks) {
        return Err<RecordOutcome>(Error::validation(
            "Chunk index " + std::to_string(chunk_index) + " outside [0, " +
            std::to_string(total_chunks) + ")"));
    }

    auto outcome = store_.record_chunk(upload_id, chunk_index);
    if (outcome.is_error()) {
        return outcome;
    }

    const auto& progress = outcome.value().progress;
    if (outcome.value().newly_recorded && progress.is_complete) {
        spdlog::info("Upload {} has all {} chunks recorded", upload_id, progress.total_chunks);
    }
    return outcome;
}

Result<ChunkProgress> ChunkRecorder::get_progress(const std::string& upload_id) {
    return store_.progress(upload_id);
}

Result<bool> ChunkRecorder::is_recorded(const std::string& upload_id, std::int32_t chunk_index) {
    return store_.has_chunk(upload_id, chunk_index);
}

std::vector<std::int32_t> ChunkRecorder::missing_indices(const ChunkProgress& progress) {
    std::vector<std::int32_t> missing;
    std::size_t next = 0;
    for (std::int32_t index = 0; index < progress.total_chunks; ++index) {
        while (next < progress.uploaded_indices.size() && progress.uploaded_indices[next] < index) {
            ++next;
        }
        if (next < progress.uploaded_indices.size() && progress.uploaded_indices[next] == index) {
            continue;
        }
        missing.push_back(index);
    }
    return missing;
}

} // namespace chunkup::upload
