#include "chunkup/upload/cleanup_worker.hpp"

#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chunkup::upload {

namespace {
constexpr std::chrono::milliseconds kIdlePoll{200};
}

CleanupWorker::CleanupWorker(CleanupAction action, events::EventBus& bus, CleanupSettings settings)
    : action_(std::move(action))
    , bus_(bus)
    , settings_(settings) {
}

CleanupWorker::~CleanupWorker() {
    stop();
}

CleanupWorker::CleanupAction CleanupWorker::remove_session(store::UploadStore& store) {
    return [&store](const std::string& upload_id) -> Result<void> {
        auto removed = store.delete_session(upload_id);
        if (removed.is_error()) {
            return Err<void>(removed.error());
        }
        if (!removed.value()) {
            spdlog::debug("Cleanup: session {} already gone", upload_id);
        }
        return Ok();
    };
}

void CleanupWorker::start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
}

void CleanupWorker::stop() {
    queue_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool CleanupWorker::enqueue(const std::string& upload_id) {
    {
        std::lock_guard lock(idle_mutex_);
        ++outstanding_;
    }
    if (!queue_.push(Task{upload_id, 0, std::chrono::steady_clock::now()})) {
        spdlog::warn("Cleanup worker stopped; session {} left for the expiry sweep", upload_id);
        finish_task();
        return false;
    }
    return true;
}

bool CleanupWorker::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return outstanding_ == 0; });
}

std::size_t CleanupWorker::outstanding() const {
    std::lock_guard lock(idle_mutex_);
    return outstanding_;
}

void CleanupWorker::finish_task() {
    {
        std::lock_guard lock(idle_mutex_);
        --outstanding_;
    }
    idle_cv_.notify_all();
}

std::chrono::milliseconds CleanupWorker::backoff_for(int attempt) const {
    auto delay = settings_.initial_backoff;
    for (int i = 1; i < attempt && delay < settings_.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, settings_.max_backoff);
}

void CleanupWorker::run() {
    spdlog::debug("Cleanup worker started");

    while (true) {
        auto wait = kIdlePoll;
        if (!retries_.empty()) {
            const auto earliest = std::min_element(retries_.begin(), retries_.end(),
                [](const Task& a, const Task& b) { return a.not_before < b.not_before; })->not_before;
            const auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
                earliest - std::chrono::steady_clock::now());
            wait = std::clamp(until, std::chrono::milliseconds{0}, kIdlePoll);
        }

        auto task = queue_.pop_for(wait);
        if (task) {
            retries_.push_back(std::move(*task));
        } else if (queue_.closed()) {
            break;
        }

        process_due(std::chrono::steady_clock::now());
    }

    if (!retries_.empty()) {
        spdlog::warn("Cleanup worker stopping with {} pending retr{}; the expiry sweep will remove them",
                     retries_.size(), retries_.size() == 1 ? "y" : "ies");
        for (std::size_t i = 0; i < retries_.size(); ++i) {
            finish_task();
        }
        retries_.clear();
    }
    spdlog::debug("Cleanup worker stopped");
}

void CleanupWorker::process_due(std::chrono::steady_clock::time_point now) {
    std::vector<Task> still_waiting;

    for (auto& task : retries_) {
        if (task.not_before > now) {
            still_waiting.push_back(std::move(task));
            continue;
        }

        task.attempt++;
        auto result = action_(task.upload_id);
        if (result.is_ok()) {
            spdlog::debug("Cleaned up session {} (attempt {})", task.upload_id, task.attempt);
            finish_task();
            continue;
        }

        const bool gave_up = task.attempt >= settings_.max_attempts;
        bus_.emit(events::CleanupFailedEvent{task.upload_id, task.attempt, gave_up, result.error().message});

        if (gave_up) {
            finish_task();
            continue;
        }
        task.not_before = now + backoff_for(task.attempt);
        still_waiting.push_back(std::move(task));
    }

    retries_ = std::move(still_waiting);
}

} // namespace chunkup::upload
