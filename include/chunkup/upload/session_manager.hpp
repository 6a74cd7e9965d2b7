#pragma once

#include "chunkup/store/upload_store.hpp"
#include "chunkup/upload/chunk_recorder.hpp"
#include "chunkup/upload/types.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace chunkup::upload {

struct SessionSettings {
    std::int64_t chunk_size_bytes = 5 * 1024 * 1024;
    std::chrono::seconds session_ttl{24 * 60 * 60};
    bool strict_chunk_count = false;   // Require total_chunks == ceil(size / chunk_size)
};

/**
 * @brief Creates, looks up, cancels and expires upload sessions
 *
 * Every lookup applies the same visibility rule: a session that is absent
 * or whose expires_at has passed is NotFound; one owned by somebody else
 * is Forbidden.
 */
class SessionManager {
public:
    using ClockFn = std::function<TimePoint()>;

    /// @param clock Defaults to system_clock::now
    SessionManager(store::UploadStore& store,
                   ChunkRecorder& recorder,
                   SessionSettings settings,
                   ClockFn clock = nullptr);

    /**
     * @brief Validate the request and persist a new session
     *
     * Nothing is written when validation fails.
     */
    Result<InitResponse> init(const std::string& owner_id, const InitRequest& request);

    Result<SessionStatus> status(const std::string& upload_id, const std::string& caller_id);

    /// Shared check for chunk and finalize paths
    Result<UploadSession> require_active(const std::string& upload_id, const std::string& caller_id);

    /// Remove the session and its ledger; later calls on the id are NotFound
    Result<void> cancel(const std::string& upload_id, const std::string& caller_id);

    /// Remove every session whose expires_at has passed; returns their ids
    Result<std::vector<std::string>> purge_expired();

    TimePoint now() const { return clock_(); }

    const SessionSettings& settings() const { return settings_; }

    /**
     * @brief "file_" + 16 hex digits of epoch ms + 16 random hex digits + ".ext"
     *
     * The extension is whatever follows the last '.' of @p file_name; a name
     * without a dot gets none.
     */
    static std::string make_storage_file_name(const std::string& file_name, TimePoint now);

private:
    store::UploadStore& store_;
    ChunkRecorder& recorder_;
    SessionSettings settings_;
    ClockFn clock_;
};

} // namespace chunkup::upload
