/**
 * @file components.hpp
 * @brief Event-driven logging and metrics for the upload coordinator
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Components react to every emitted upload event
 */

#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace chunkup::events {

/**
 * @brief Logs every upload event through spdlog
 *
 * Per-chunk events go to debug so a 2 GiB upload does not flood the log.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<UploadInitializedEvent>([](const UploadInitializedEvent& e) {
            spdlog::info("[UploadInitialized] upload={} owner={} name={} size={} chunks={} storage={}",
                         e.upload_id, e.owner_id, e.file_name, e.total_size_bytes,
                         e.total_chunks, e.storage_file_name);
        });

        bus.subscribe<ChunkAppendedEvent>([](const ChunkAppendedEvent& e) {
            spdlog::debug("[ChunkAppended] upload={} chunk={} bytes={} progress={}/{} remote_size={}",
                          e.upload_id, e.chunk_index, e.bytes, e.uploaded_count,
                          e.total_chunks, e.remote_size);
        });

        bus.subscribe<ChunkSkippedEvent>([](const ChunkSkippedEvent& e) {
            spdlog::debug("[ChunkSkipped] upload={} chunk={} already recorded", e.upload_id, e.chunk_index);
        });

        bus.subscribe<UploadFinalizedEvent>([](const UploadFinalizedEvent& e) {
            spdlog::info("[UploadFinalized] upload={} path={} size={}{}",
                         e.upload_id, e.storage_path, e.size_bytes,
                         e.newly_created ? "" : " (existing record)");
        });

        bus.subscribe<UploadRejectedEvent>([](const UploadRejectedEvent& e) {
            // Client mistakes are routine; only server-side failures are warnings
            const bool server_side = e.code == ErrorCode::RemoteUnavailable ||
                                     e.code == ErrorCode::Storage ||
                                     e.code == ErrorCode::Internal ||
                                     e.code == ErrorCode::IntegrityMismatch ||
                                     e.code == ErrorCode::RemoteFileMissing;
            if (server_side) {
                spdlog::warn("[UploadRejected] upload={} op={} code={} message={}",
                             e.upload_id, e.operation, error_code_name(e.code), e.message);
            } else {
                spdlog::info("[UploadRejected] upload={} op={} code={} message={}",
                             e.upload_id, e.operation, error_code_name(e.code), e.message);
            }
        });

        bus.subscribe<UploadCancelledEvent>([](const UploadCancelledEvent& e) {
            spdlog::info("[UploadCancelled] upload={} owner={}", e.upload_id, e.owner_id);
        });

        bus.subscribe<SessionsExpiredEvent>([](const SessionsExpiredEvent& e) {
            spdlog::info("[SessionsExpired] removed {} expired session(s)", e.upload_ids.size());
        });

        bus.subscribe<CleanupFailedEvent>([](const CleanupFailedEvent& e) {
            if (e.gave_up) {
                spdlog::error("[CleanupFailed] upload={} attempt={} giving up: {}",
                              e.upload_id, e.attempt, e.message);
            } else {
                spdlog::warn("[CleanupFailed] upload={} attempt={} will retry: {}",
                             e.upload_id, e.attempt, e.message);
            }
        });

        bus.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("chunkup listening on port {}", e.port);
            spdlog::info("Storage node: {}", e.storage_endpoint);
            spdlog::info("════════════════════════════════════════════");
        });

        bus.subscribe<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("Server shutting down: {}", e.reason);
        });
    }
};

/**
 * @brief Atomic counters over upload events
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().chunks_appended.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> sessions_created{0};
        std::atomic<std::uint64_t> chunks_appended{0};
        std::atomic<std::uint64_t> chunks_skipped{0};
        std::atomic<std::uint64_t> bytes_appended{0};
        std::atomic<std::uint64_t> uploads_finalized{0};
        std::atomic<std::uint64_t> bytes_finalized{0};
        std::atomic<std::uint64_t> uploads_cancelled{0};
        std::atomic<std::uint64_t> sessions_expired{0};
        std::atomic<std::uint64_t> failures{0};
        std::atomic<std::uint64_t> cleanup_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<UploadInitializedEvent>([this](const UploadInitializedEvent&) {
            stats_.sessions_created++;
        });

        bus.subscribe<ChunkAppendedEvent>([this](const ChunkAppendedEvent& e) {
            stats_.chunks_appended++;
            stats_.bytes_appended += e.bytes;
        });

        bus.subscribe<ChunkSkippedEvent>([this](const ChunkSkippedEvent&) {
            stats_.chunks_skipped++;
        });

        bus.subscribe<UploadFinalizedEvent>([this](const UploadFinalizedEvent& e) {
            // Count each file once, not every idempotent retry
            if (e.newly_created) {
                stats_.uploads_finalized++;
                stats_.bytes_finalized += static_cast<std::uint64_t>(e.size_bytes);
            }
        });

        bus.subscribe<UploadCancelledEvent>([this](const UploadCancelledEvent&) {
            stats_.uploads_cancelled++;
        });

        bus.subscribe<SessionsExpiredEvent>([this](const SessionsExpiredEvent& e) {
            stats_.sessions_expired += e.upload_ids.size();
        });

        bus.subscribe<UploadRejectedEvent>([this](const UploadRejectedEvent&) {
            stats_.failures++;
        });

        bus.subscribe<CleanupFailedEvent>([this](const CleanupFailedEvent&) {
            stats_.cleanup_failures++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload statistics:");
        spdlog::info("  Sessions created:  {}", stats_.sessions_created.load());
        spdlog::info("  Chunks appended:   {}", stats_.chunks_appended.load());
        spdlog::info("  Chunks skipped:    {}", stats_.chunks_skipped.load());
        spdlog::info("  Bytes appended:    {}", stats_.bytes_appended.load());
        spdlog::info("  Uploads finalized: {}", stats_.uploads_finalized.load());
        spdlog::info("  Bytes finalized:   {}", stats_.bytes_finalized.load());
        spdlog::info("  Uploads cancelled: {}", stats_.uploads_cancelled.load());
        spdlog::info("  Sessions expired:  {}", stats_.sessions_expired.load());
        spdlog::info("  Failures:          {}", stats_.failures.load());
        spdlog::info("  Cleanup failures:  {}", stats_.cleanup_failures.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
};

} // namespace chunkup::events
