#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/event_queue.hpp"
#include "chunkup/store/upload_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chunkup::upload {

struct CleanupSettings {
    int max_attempts = 5;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{60 * 1000};
};

/**
 * @brief Background removal of finalized sessions with retry and backoff
 *
 * Finalize enqueues the upload id and returns immediately. A failed
 * attempt is retried after initial_backoff * 2^(attempt-1), capped at
 * max_backoff, up to max_attempts; every failure emits CleanupFailedEvent.
 * A session that exhausts its attempts is left for the expiry sweep.
 *
 * stop() abandons pending retries and joins the thread.
 */
class CleanupWorker {
public:
    using CleanupAction = std::function<Result<void>(const std::string& upload_id)>;

    CleanupWorker(CleanupAction action, events::EventBus& bus, CleanupSettings settings);
    ~CleanupWorker();

    CleanupWorker(const CleanupWorker&) = delete;
    CleanupWorker& operator=(const CleanupWorker&) = delete;

    /// Deletes the session row and its ledger; an already missing session counts as done
    static CleanupAction remove_session(store::UploadStore& store);

    void start();
    void stop();

    /// @return false once the worker has been stopped
    bool enqueue(const std::string& upload_id);

    /// Block until every enqueued id succeeded or gave up; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

    std::size_t outstanding() const;

private:
    struct Task {
        std::string upload_id;
        int attempt = 0;
        std::chrono::steady_clock::time_point not_before{};
    };

    void run();
    void process_due(std::chrono::steady_clock::time_point now);
    void finish_task();
    std::chrono::milliseconds backoff_for(int attempt) const;

    CleanupAction action_;
    events::EventBus& bus_;
    CleanupSettings settings_;

    events::ThreadSafeQueue<Task> queue_;
    std::vector<Task> retries_;   // Worker thread only
    std::thread thread_;
    std::atomic<bool> started_{false};

    mutable std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    std::size_t outstanding_ = 0;
};

} // namespace chunkup::upload
