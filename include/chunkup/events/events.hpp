/**
 * @file events.hpp
 * @brief Upload lifecycle events
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: ChunkAppendedEvent, UploadFinalizedEvent.
 * They are emitted after the corresponding state change is durable.
 */

#pragma once

#include "chunkup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkup::events {

using Clock = std::chrono::system_clock;

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief A new upload session was persisted
 *
 * WHO EMITS: UploadService::init
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadInitializedEvent {
    std::string upload_id;
    std::string owner_id;
    std::string file_name;
    std::string storage_file_name;
    std::int64_t total_size_bytes = 0;
    std::int32_t total_chunks = 0;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief A chunk was appended remotely and recorded in the ledger
 */
struct ChunkAppendedEvent {
    std::string upload_id;
    std::int32_t chunk_index = 0;
    std::uint64_t bytes = 0;
    std::int32_t uploaded_count = 0;
    std::int32_t total_chunks = 0;
    std::int64_t remote_size = 0;
    Clock::time_point timestamp = Clock::now();
};

/// Chunk already in the ledger; bytes were not re-sent
struct ChunkSkippedEvent {
    std::string upload_id;
    std::int32_t chunk_index = 0;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief A FileRecord is committed for the session
 *
 * newly_created is false when the call returned a record committed earlier
 * (retry or lost race).
 */
struct UploadFinalizedEvent {
    std::string upload_id;
    std::string storage_path;
    std::int64_t size_bytes = 0;
    bool newly_created = true;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief An operation on a session failed
 *
 * operation is one of "init", "chunk", "status", "finalize", "cancel".
 */
struct UploadRejectedEvent {
    std::string upload_id;
    std::string operation;
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    Clock::time_point timestamp = Clock::now();
};

struct UploadCancelledEvent {
    std::string upload_id;
    std::string owner_id;
    Clock::time_point timestamp = Clock::now();
};

/// Emitted by the expiry sweep when it removed at least one session
struct SessionsExpiredEvent {
    std::vector<std::string> upload_ids;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief Post-finalize cleanup attempt failed
 *
 * gave_up is true on the last allowed attempt; the session row then stays
 * until the expiry sweep removes it.
 */
struct CleanupFailedEvent {
    std::string upload_id;
    int attempt = 0;
    bool gave_up = false;
    std::string message;
    Clock::time_point timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::uint16_t port = 0;
    std::string storage_endpoint;
    Clock::time_point timestamp = Clock::now();
};

struct ServerShuttingDownEvent {
    std::string reason;
    Clock::time_point timestamp = Clock::now();
};

} // namespace chunkup::events
