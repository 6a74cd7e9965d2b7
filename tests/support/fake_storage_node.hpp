#pragma once

#include "chunkup/remote/storage_node.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkup::testing {

/**
 * @brief In-memory storage node honouring the positional-append contract
 *
 * Bytes land at exactly request.offset; the file grows as needed. Failures,
 * lost files and a lying size can be injected per test.
 */
class FakeStorageNode : public remote::StorageNode {
public:
    Result<remote::AppendResult> append(const remote::AppendRequest& request,
                                        const std::vector<std::uint8_t>& bytes) override {
        append_calls_++;
        wait_at_gate();
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_next_appends_ > 0) {
            fail_next_appends_--;
            return Err<remote::AppendResult>(Error::remote_unavailable("injected append failure"));
        }

        auto& file = files_[key(request.owner_id, request.storage_file_name)];
        const auto end = static_cast<std::size_t>(request.offset) + bytes.size();
        if (file.size() < end) {
            file.resize(end, 0);
        }
        std::copy(bytes.begin(), bytes.end(), file.begin() + request.offset);
        requests_.push_back(request);

        std::int64_t reported = static_cast<std::int64_t>(file.size());
        if (reported_size_) {
            reported = *reported_size_;
        }
        return Ok(remote::AppendResult{reported});
    }

    Result<remote::VerifyResult> verify(const std::string& storage_file_name,
                                        const std::string& owner_id,
                                        std::int64_t /*expected_size*/) override {
        verify_calls_++;
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_verify_) {
            return Err<remote::VerifyResult>(Error::remote_unavailable("injected verify failure"));
        }
        auto it = files_.find(key(owner_id, storage_file_name));
        if (it == files_.end()) {
            return Ok(remote::VerifyResult{false, 0});
        }
        std::int64_t size = static_cast<std::int64_t>(it->second.size());
        if (verify_size_) {
            size = *verify_size_;
        }
        return Ok(remote::VerifyResult{true, size});
    }

    // Injection

    /// The next @p parties appends wait for each other before writing
    void gate_appends(int parties) {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        gate_parties_ = parties;
        gate_arrived_ = 0;
    }

    void fail_next_appends(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_next_appends_ = count;
    }

    void set_fail_verify(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_verify_ = fail;
    }

    void set_reported_size(std::optional<std::int64_t> size) {
        std::lock_guard<std::mutex> lock(mutex_);
        reported_size_ = size;
    }

    void set_verify_size(std::optional<std::int64_t> size) {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_size_ = size;
    }

    void lose_file(const std::string& owner_id, const std::string& storage_file_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_.erase(key(owner_id, storage_file_name));
    }

    // Inspection

    std::optional<std::vector<std::uint8_t>> contents(const std::string& owner_id,
                                                      const std::string& storage_file_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(key(owner_id, storage_file_name));
        if (it == files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<remote::AppendRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    int append_calls() const { return append_calls_.load(); }
    int verify_calls() const { return verify_calls_.load(); }

private:
    void wait_at_gate() {
        std::unique_lock<std::mutex> lock(gate_mutex_);
        if (gate_parties_ <= 0) {
            return;
        }
        if (++gate_arrived_ >= gate_parties_) {
            gate_parties_ = 0;
            gate_cv_.notify_all();
            return;
        }
        gate_cv_.wait_for(lock, std::chrono::seconds(5), [this]() { return gate_parties_ == 0; });
    }

    static std::string key(const std::string& owner_id, const std::string& storage_file_name) {
        return owner_id + "/" + storage_file_name;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::uint8_t>> files_;
    std::vector<remote::AppendRequest> requests_;
    int fail_next_appends_ = 0;
    bool fail_verify_ = false;
    std::optional<std::int64_t> reported_size_;
    std::optional<std::int64_t> verify_size_;
    std::atomic<int> append_calls_{0};
    std::atomic<int> verify_calls_{0};

    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    int gate_parties_ = 0;
    int gate_arrived_ = 0;
};

/// Bytes with a recognisable per-chunk pattern
inline std::vector<std::uint8_t> make_chunk(std::size_t size, std::uint8_t seed) {
    std::vector<std::uint8_t> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::uint8_t>(seed + i);
    }
    return bytes;
}

} // namespace chunkup::testing
