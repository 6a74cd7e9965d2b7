/**
 * @file finalizer.hpp
 * @brief Commits a fully uploaded session as a single file record
 *
 * WHY THIS FILE EXISTS:
 * Clients retry finalize after timeouts and may send it twice at once.
 * Each upload must still produce exactly one FileRecord, and a retry must
 * get the same record back instead of an error.
 *
 * WHAT IT DOES:
 * - Returns the committed record when the upload was already finalized
 * - Checks completeness against the ledger and reports the missing indices
 * - Inserts the record with insert-if-absent semantics
 * - Hands the finished session to the cleanup worker
 */

#pragma once

#include "chunkup/remote/storage_client.hpp"
#include "chunkup/store/upload_store.hpp"
#include "chunkup/upload/chunk_recorder.hpp"
#include "chunkup/upload/cleanup_worker.hpp"
#include "chunkup/upload/session_manager.hpp"

#include <string>

namespace chunkup::upload {

/**
 * @brief Outcome of a successful finalize
 *
 * newly_created is false when an earlier call (or a concurrent one that
 * won the race) had already committed the record.
 */
struct FinalizeOutcome {
    FileRecord record;
    bool newly_created = false;
};

/**
 * @brief Turns a complete session into exactly one FileRecord
 *
 * Sequence:
 *  1. existing record for the upload, owned by the caller -> return it
 *  2. session must be active and owned by the caller
 *  3. storage file name, when given, must match the session
 *  4. ledger complete, otherwise Incomplete with the missing indices
 *  5. storage node verify: missing -> RemoteFileMissing, wrong size -> IntegrityMismatch
 *  6. insert-if-absent on storage_path with the verified size
 *  7. hand the session to the cleanup worker
 *
 * Safe to call concurrently for the same upload; all callers get the same record.
 */
class Finalizer {
public:
    Finalizer(store::UploadStore& store,
              SessionManager& sessions,
              ChunkRecorder& recorder,
              remote::StorageAppendClient& storage,
              CleanupWorker& cleanup);

    Result<FinalizeOutcome> finalize(const std::string& upload_id,
                                     const std::string& storage_file_name,
                                     const std::string& caller_id);

    /// owner_id + "/" + storage_file_name
    static std::string storage_path_for(const UploadSession& session);

private:
    store::UploadStore& store_;
    SessionManager& sessions_;
    ChunkRecorder& recorder_;
    remote::StorageAppendClient& storage_;
    CleanupWorker& cleanup_;
};

} // namespace chunkup::upload
