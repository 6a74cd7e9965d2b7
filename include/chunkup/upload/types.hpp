#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::upload {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Derived lifecycle state of an upload session
 *
 * Never stored: computed from the session row, the chunk ledger and the
 * file catalog (see state.hpp).
 */
enum class UploadState {
    Created,     // Session exists, no chunk recorded yet
    Uploading,   // Some but not all chunks recorded
    Complete,    // Every chunk recorded, not finalized yet
    Finalized,   // FileRecord committed
    Expired      // expires_at passed before finalize
};

/**
 * @brief Bookkeeping record for one resumable upload attempt
 */
struct UploadSession {
    std::string upload_id;
    std::string owner_id;
    std::string file_name;
    std::string mime_type;
    std::int64_t total_size_bytes = 0;
    std::int32_t total_chunks = 0;
    std::string storage_file_name;       ///< Assigned once at init, never changes
    std::optional<std::string> folder_id;
    TimePoint created_at{};
    TimePoint expires_at{};

    bool is_expired(TimePoint now) const { return now >= expires_at; }
};

/**
 * @brief Ledger-derived progress of a session
 */
struct ChunkProgress {
    std::int32_t uploaded_count = 0;
    std::int32_t total_chunks = 0;
    double progress_pct = 0.0;
    bool is_complete = false;
    std::vector<std::int32_t> uploaded_indices;  ///< Ascending
};

/**
 * @brief Durable, user-visible result of a successful finalize
 */
struct FileRecord {
    std::int64_t id = 0;
    std::string owner_id;
    std::optional<std::string> folder_id;
    std::string name;
    std::string original_name;
    std::string mime_type;
    std::int64_t size_bytes = 0;
    std::string storage_path;   ///< owner_id + "/" + storage_file_name
    std::string upload_id;      ///< Session that produced the record
    TimePoint created_at{};
};

// ────────────────────────────────────────────────────────────
// Request / response payloads
// ────────────────────────────────────────────────────────────

struct InitRequest {
    std::string file_name;
    std::string mime_type;
    std::int64_t total_size_bytes = 0;
    std::int32_t total_chunks = 0;
    std::optional<std::string> folder_id;
};

struct InitResponse {
    std::string upload_id;
    std::string storage_file_name;
    std::int64_t chunk_size_bytes = 0;
    std::int32_t total_chunks = 0;
    TimePoint expires_at{};
};

struct SessionStatus {
    UploadSession session;
    ChunkProgress progress;
    UploadState state = UploadState::Created;
};

/**
 * @brief Outcome of one atomic insert-if-absent + recount on the ledger
 */
struct RecordOutcome {
    ChunkProgress progress;
    bool newly_recorded = false;
};

/**
 * @brief One chunk as received from the client
 */
struct ChunkUpload {
    std::string upload_id;
    std::int32_t chunk_index = -1;
    std::string storage_file_name;   ///< Optional; must match the session when given
    std::vector<std::uint8_t> data;
};

struct ChunkReceipt {
    std::int32_t chunk_index = 0;
    ChunkProgress progress;
    bool skipped = false;                             ///< Already in the ledger; nothing newly recorded
    std::optional<std::int64_t> current_remote_size;  ///< Absent when no bytes were sent
};

inline const char* upload_state_name(UploadState state) {
    switch (state) {
        case UploadState::Created: return "created";
        case UploadState::Uploading: return "uploading";
        case UploadState::Complete: return "complete";
        case UploadState::Finalized: return "finalized";
        case UploadState::Expired: return "expired";
    }
    return "unknown";
}

} // namespace chunkup::upload
