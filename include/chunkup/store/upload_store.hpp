#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::store {

using upload::ChunkProgress;
using upload::FileRecord;
using upload::RecordOutcome;
using upload::TimePoint;
using upload::UploadSession;

/**
 * @brief Durable persistence for sessions, the chunk ledger and file records
 *
 * Every method is a single indivisible unit of work with respect to other
 * callers of the same store. In particular record_chunk() performs the
 * insert-if-absent and the recount atomically, and insert_file_record() is
 * insert-if-absent keyed on storage_path.
 *
 * Errors are reported as ErrorCode::Storage, except record_chunk() and
 * progress() which return ErrorCode::NotFound when the session row is gone.
 */
class UploadStore {
public:
    virtual ~UploadStore() = default;

    // Sessions
    virtual Result<void> insert_session(const UploadSession& session) = 0;
    virtual Result<std::optional<UploadSession>> find_session(const std::string& upload_id) = 0;

    /// Removes the session and its ledger rows; returns false when nothing was there
    virtual Result<bool> delete_session(const std::string& upload_id) = 0;

    /// Removes sessions (and their ledgers) with expires_at <= now; returns their ids
    virtual Result<std::vector<std::string>> delete_expired_sessions(TimePoint now) = 0;

    // Chunk ledger
    virtual Result<RecordOutcome> record_chunk(const std::string& upload_id, std::int32_t chunk_index) = 0;
    virtual Result<ChunkProgress> progress(const std::string& upload_id) = 0;
    virtual Result<bool> has_chunk(const std::string& upload_id, std::int32_t chunk_index) = 0;

    // File records
    /**
     * @brief Insert unless a record with the same storage_path exists
     * @return The committed record (the pre-existing one if the insert lost a race)
     *         and whether this call created it
     */
    virtual Result<std::pair<FileRecord, bool>> insert_file_record(const FileRecord& record) = 0;
    virtual Result<std::optional<FileRecord>> find_file_by_upload(const std::string& upload_id) = 0;
    virtual Result<std::optional<FileRecord>> find_file_by_path(const std::string& storage_path) = 0;
    virtual Result<std::int64_t> count_file_records() = 0;
};

} // namespace chunkup::store
