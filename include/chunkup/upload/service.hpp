/**
 * @file service.hpp
 * @brief Request-level entry point for the resumable upload workflow
 *
 * WHY THIS FILE EXISTS:
 * The HTTP layer should not know about ledgers, storage nodes or events.
 * It hands an authenticated caller id and a decoded request to one object
 * and maps the Result it gets back onto a status code.
 *
 * WHAT IT DOES:
 * - init: opens a session through SessionManager
 * - upload_chunk: validates the chunk, appends it to the storage node,
 *   then records the index in the ledger
 * - status / cancel: report or abandon an active session
 * - finalize: delegates to Finalizer once every chunk is recorded
 * - publishes a lifecycle event after each success or failure
 *
 * HOW IT INTEGRATES:
 * - server/api.cpp decodes JSON into InitRequest / ChunkUpload and calls here
 * - events/components.hpp turns the published events into logs and metrics
 *
 * EXAMPLE:
 * auto receipt = service.upload_chunk("alice", chunk);
 * if (receipt.is_ok() && receipt.value().progress.is_complete) {
 *     service.finalize("alice", chunk.upload_id, chunk.storage_file_name);
 * }
 */

#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/remote/storage_client.hpp"
#include "chunkup/upload/chunk_recorder.hpp"
#include "chunkup/upload/finalizer.hpp"
#include "chunkup/upload/session_manager.hpp"

#include <string>

namespace chunkup::upload {

/**
 * @brief Request-level upload operations used by the HTTP layer
 *
 * Every operation takes the authenticated caller id. Successes and
 * failures are published on the event bus after the fact.
 */
class UploadService {
public:
    UploadService(SessionManager& sessions,
                  ChunkRecorder& recorder,
                  remote::StorageAppendClient& storage,
                  Finalizer& finalizer,
                  events::EventBus& bus);

    Result<InitResponse> init(const std::string& caller_id, const InitRequest& request);

    /**
     * @brief Append one chunk remotely, then record it
     *
     * Order: active session -> index in range -> non-empty payload ->
     * storage file name matches -> already recorded (skipped, nothing
     * sent) -> remote append -> ledger insert. A failed append leaves the
     * ledger untouched so the client can simply retry the chunk.
     */
    Result<ChunkReceipt> upload_chunk(const std::string& caller_id, const ChunkUpload& chunk);

    Result<SessionStatus> status(const std::string& caller_id, const std::string& upload_id);

    Result<FileRecord> finalize(const std::string& caller_id,
                                const std::string& upload_id,
                                const std::string& storage_file_name);

    Result<void> cancel(const std::string& caller_id, const std::string& upload_id);

    /// Expiry sweep; returns the number of sessions removed
    Result<std::size_t> purge_expired();

private:
    void reject(const std::string& upload_id, const char* operation, const Error& error);

    SessionManager& sessions_;
    ChunkRecorder& recorder_;
    remote::StorageAppendClient& storage_;
    Finalizer& finalizer_;
    events::EventBus& bus_;
};

} // namespace chunkup::upload
