#pragma once

#include "chunkup/store/upload_store.hpp"
#include "chunkup/upload/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chunkup::upload {

/**
 * @brief Chunk ledger: which indices of a session are confirmed on the storage node
 *
 * record_chunk() is a single atomic store operation, so concurrent calls
 * for different indices of one upload each see a count that includes
 * their own insert, and exactly one of them observes is_complete first.
 */
class ChunkRecorder {
public:
    explicit ChunkRecorder(store::UploadStore& store);

    /**
     * @brief Mark @p chunk_index as uploaded (idempotent)
     *
     * @retval ErrorCode::Validation index outside [0, total_chunks)
     * @retval ErrorCode::NotFound no such session
     */
    Result<RecordOutcome> record_chunk(const std::string& upload_id, std::int32_t chunk_index);

    Result<ChunkProgress> get_progress(const std::string& upload_id);

    Result<bool> is_recorded(const std::string& upload_id, std::int32_t chunk_index);

    /// [0, total_chunks) minus the uploaded indices, ascending
    static std::vector<std::int32_t> missing_indices(const ChunkProgress& progress);

private:
    store::UploadStore& store_;
};

} // namespace chunkup::upload
