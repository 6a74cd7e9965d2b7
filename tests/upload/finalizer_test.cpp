#include "support/upload_harness.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace chunkup;
using chunkup::testing::UploadHarness;

namespace {

constexpr std::int64_t kTotalSize = 75;   // 9 full chunks + 3 bytes
constexpr std::int32_t kChunks = 10;

void upload_chunks(UploadHarness& h, const upload::InitResponse& init, const std::vector<std::int32_t>& indices) {
    for (auto index : indices) {
        auto receipt = h.send_chunk("alice", init, index, kTotalSize);
        ASSERT_TRUE(receipt.is_ok()) << receipt.error().message;
    }
}

void upload_all(UploadHarness& h, const upload::InitResponse& init) {
    std::vector<std::int32_t> all;
    for (std::int32_t i = 0; i < kChunks; ++i) {
        all.push_back(i);
    }
    upload_chunks(h, init, all);
}

} // namespace

TEST(FinalizerTest, IncompleteReturnsExactComplement) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_chunks(h, init, {0, 1, 2, 4, 5, 7, 9});

    auto result = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Incomplete);
    EXPECT_EQ(result.error().missing_chunks, (std::vector<std::int32_t>{3, 6, 8}));

    EXPECT_EQ(h.store->count_file_records().value(), 0);
    EXPECT_EQ(h.node->verify_calls(), 0);
}

TEST(FinalizerTest, CompleteUploadCreatesRecord) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);

    auto result = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const auto& record = result.value().record;
    EXPECT_TRUE(result.value().newly_created);
    EXPECT_EQ(record.owner_id, "alice");
    EXPECT_EQ(record.name, "movie.mp4");
    EXPECT_EQ(record.original_name, "movie.mp4");
    EXPECT_EQ(record.mime_type, "video/mp4");
    EXPECT_EQ(record.size_bytes, kTotalSize);
    EXPECT_EQ(record.storage_path, "alice/" + init.storage_file_name);
    EXPECT_EQ(record.upload_id, init.upload_id);
}

TEST(FinalizerTest, EmptyStorageNameFallsBackToSession) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);

    EXPECT_TRUE(h.finalizer.finalize(init.upload_id, "", "alice").is_ok());
}

TEST(FinalizerTest, MismatchedStorageNameIsValidation) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);

    auto result = h.finalizer.finalize(init.upload_id, "file_other.mp4", "alice");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
}

TEST(FinalizerTest, RepeatedFinalizeReturnsSameRecord) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);

    auto first = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(h.cleanup.wait_idle(std::chrono::seconds(5)));

    // Session is gone after cleanup; the record still answers
    auto second = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
    ASSERT_TRUE(second.is_ok()) << second.error().message;
    EXPECT_FALSE(second.value().newly_created);
    EXPECT_EQ(second.value().record.id, first.value().record.id);
    EXPECT_EQ(h.store->count_file_records().value(), 1);
}

TEST(FinalizerTest, RetryWithWrongStorageNameIsValidation) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);

    ASSERT_TRUE(h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice").is_ok());
    ASSERT_TRUE(h.cleanup.wait_idle(std::chrono::seconds(5)));

    auto mismatched = h.finalizer.finalize(init.upload_id, "file_other.mp4", "alice");
    ASSERT_TRUE(mismatched.is_error());
    EXPECT_EQ(mismatched.error().code, ErrorCode::Validation);

    // Omitting the name still returns the committed record
    auto unnamed = h.finalizer.finalize(init.upload_id, "", "alice");
    ASSERT_TRUE(unnamed.is_ok()) << unnamed.error().message;
    EXPECT_FALSE(unnamed.value().newly_created);
}

TEST(FinalizerTest, ConcurrentFinalizeYieldsOneRecord) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);

    std::atomic<int> created{0};
    std::atomic<int> succeeded{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&]() {
            auto result = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
            if (result.is_ok()) {
                succeeded++;
                if (result.value().newly_created) {
                    created++;
                }
            }
        });
    }
    for (auto& c : callers) {
        c.join();
    }

    EXPECT_EQ(created.load(), 1);
    EXPECT_GE(succeeded.load(), 1);
    EXPECT_EQ(h.store->count_file_records().value(), 1);
}

TEST(FinalizerTest, OtherOwnerCannotFinalize) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);

    auto result = h.finalizer.finalize(init.upload_id, init.storage_file_name, "mallory");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Forbidden);
}

TEST(FinalizerTest, MissingRemoteFile) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);
    h.node->lose_file("alice", init.storage_file_name);

    auto result = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::RemoteFileMissing);
    EXPECT_EQ(h.store->count_file_records().value(), 0);
}

TEST(FinalizerTest, SizeMismatch) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);
    h.node->set_verify_size(kTotalSize - 1);

    auto result = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::IntegrityMismatch);
    EXPECT_EQ(h.store->count_file_records().value(), 0);
}

TEST(FinalizerTest, VerifyTransportFailureIsRetryable) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);
    h.node->set_fail_verify(true);

    auto failed = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::RemoteUnavailable);

    h.node->set_fail_verify(false);
    EXPECT_TRUE(h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice").is_ok());
}

TEST(FinalizerTest, ExpiredSessionIsNotFound) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);
    h.clock.advance(std::chrono::hours(25));

    auto result = h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST(FinalizerTest, CleanupRemovesSessionAfterCommit) {
    UploadHarness h;
    auto init = h.start_upload("alice", "movie.mp4", kChunks, kTotalSize);
    upload_all(h, init);

    ASSERT_TRUE(h.finalizer.finalize(init.upload_id, init.storage_file_name, "alice").is_ok());
    ASSERT_TRUE(h.cleanup.wait_idle(std::chrono::seconds(5)));

    EXPECT_FALSE(h.store->find_session(init.upload_id).value().has_value());
    EXPECT_FALSE(h.store->has_chunk(init.upload_id, 0).value());
    EXPECT_TRUE(h.store->find_file_by_upload(init.upload_id).value().has_value());
}
