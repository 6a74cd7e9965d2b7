#include "chunkup/core/encoding.hpp"
#include "chunkup/store/sqlite_upload_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace chunkup;
using chunkup::store::SqliteUploadStore;
using chunkup::upload::FileRecord;
using chunkup::upload::UploadSession;

namespace {

const TimePoint kNow = from_epoch_millis(1769052937000);

std::unique_ptr<SqliteUploadStore> open_memory_store() {
    auto opened = SqliteUploadStore::open(":memory:");
    EXPECT_TRUE(opened.is_ok());
    return std::move(opened.value());
}

UploadSession make_session(const std::string& id, std::int32_t chunks = 10,
                           TimePoint expires = kNow + std::chrono::hours(24)) {
    UploadSession session;
    session.upload_id = id;
    session.owner_id = "alice";
    session.file_name = "movie.mp4";
    session.mime_type = "video/mp4";
    session.total_size_bytes = 10 * 1024;
    session.total_chunks = chunks;
    session.storage_file_name = "file_" + id + ".mp4";
    session.created_at = kNow;
    session.expires_at = expires;
    return session;
}

FileRecord make_record(const UploadSession& session) {
    FileRecord record;
    record.owner_id = session.owner_id;
    record.name = session.file_name;
    record.original_name = session.file_name;
    record.mime_type = session.mime_type;
    record.size_bytes = session.total_size_bytes;
    record.storage_path = session.owner_id + "/" + session.storage_file_name;
    record.upload_id = session.upload_id;
    record.created_at = kNow;
    return record;
}

} // namespace

TEST(SqliteUploadStoreTest, MigratesToLatestSchema) {
    auto store = open_memory_store();
    EXPECT_EQ(store->schema_version(), 1);
}

TEST(SqliteUploadStoreTest, SessionRoundTrip) {
    auto store = open_memory_store();
    auto session = make_session("u-1");
    session.folder_id = "folder-9";
    ASSERT_TRUE(store->insert_session(session).is_ok());

    auto found = store->find_session("u-1");
    ASSERT_TRUE(found.is_ok());
    ASSERT_TRUE(found.value().has_value());
    const auto& loaded = *found.value();
    EXPECT_EQ(loaded.owner_id, "alice");
    EXPECT_EQ(loaded.total_chunks, 10);
    EXPECT_EQ(loaded.storage_file_name, "file_u-1.mp4");
    EXPECT_EQ(loaded.folder_id, std::optional<std::string>("folder-9"));
    EXPECT_EQ(to_epoch_millis(loaded.expires_at), to_epoch_millis(session.expires_at));

    auto missing = store->find_session("nope");
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value().has_value());
}

TEST(SqliteUploadStoreTest, DuplicateStorageFileNameIsStorageError) {
    auto store = open_memory_store();
    auto first = make_session("u-1");
    auto second = make_session("u-2");
    second.storage_file_name = first.storage_file_name;

    ASSERT_TRUE(store->insert_session(first).is_ok());
    auto result = store->insert_session(second);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Storage);
}

TEST(SqliteUploadStoreTest, RecordChunkIsIdempotent) {
    auto store = open_memory_store();
    ASSERT_TRUE(store->insert_session(make_session("u-1")).is_ok());

    auto first = store->record_chunk("u-1", 3);
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value().newly_recorded);
    EXPECT_EQ(first.value().progress.uploaded_count, 1);

    auto again = store->record_chunk("u-1", 3);
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value().newly_recorded);
    EXPECT_EQ(again.value().progress.uploaded_count, 1);
    EXPECT_EQ(again.value().progress.uploaded_indices, (std::vector<std::int32_t>{3}));
    EXPECT_DOUBLE_EQ(again.value().progress.progress_pct, 10.0);
}

TEST(SqliteUploadStoreTest, RecordChunkForUnknownSessionIsNotFound) {
    auto store = open_memory_store();
    auto result = store->record_chunk("ghost", 0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);

    auto progress = store->progress("ghost");
    ASSERT_TRUE(progress.is_error());
    EXPECT_EQ(progress.error().code, ErrorCode::NotFound);
}

TEST(SqliteUploadStoreTest, ConcurrentRecordsCompleteExactlyOnce) {
    auto store = open_memory_store();
    constexpr std::int32_t kChunks = 40;
    ASSERT_TRUE(store->insert_session(make_session("u-1", kChunks)).is_ok());

    std::atomic<int> newly{0};
    std::atomic<int> completions_seen{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, &newly, &completions_seen, t]() {
            // Every thread records every index, in a different order
            for (std::int32_t i = 0; i < kChunks; ++i) {
                const std::int32_t index = (t % 2 == 0) ? i : kChunks - 1 - i;
                auto outcome = store->record_chunk("u-1", index);
                ASSERT_TRUE(outcome.is_ok());
                if (outcome.value().newly_recorded) {
                    newly++;
                    if (outcome.value().progress.is_complete) {
                        completions_seen++;
                    }
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(newly.load(), kChunks);
    EXPECT_EQ(completions_seen.load(), 1);

    auto progress = store->progress("u-1");
    ASSERT_TRUE(progress.is_ok());
    EXPECT_TRUE(progress.value().is_complete);
    EXPECT_EQ(progress.value().uploaded_count, kChunks);
}

TEST(SqliteUploadStoreTest, InsertsSurviveConcurrentRolledBackRecords) {
    auto store = open_memory_store();
    constexpr int kSessions = 500;

    std::atomic<bool> done{false};
    std::thread rollbacks([&store, &done]() {
        // Each call opens a transaction and rolls it back on NotFound
        while (!done.load()) {
            auto outcome = store->record_chunk("no-such-upload", 0);
            ASSERT_TRUE(outcome.is_error());
            EXPECT_EQ(outcome.error().code, ErrorCode::NotFound);
        }
    });

    int inserted = 0;
    for (int i = 0; i < kSessions; ++i) {
        if (store->insert_session(make_session("u-" + std::to_string(i))).is_ok()) {
            inserted++;
        }
    }
    done = true;
    rollbacks.join();

    EXPECT_EQ(inserted, kSessions);
    int present = 0;
    for (int i = 0; i < kSessions; ++i) {
        auto found = store->find_session("u-" + std::to_string(i));
        ASSERT_TRUE(found.is_ok());
        if (found.value()) {
            present++;
        }
    }
    EXPECT_EQ(present, kSessions);
}

TEST(SqliteUploadStoreTest, DeleteSessionRemovesLedger) {
    auto store = open_memory_store();
    ASSERT_TRUE(store->insert_session(make_session("u-1")).is_ok());
    ASSERT_TRUE(store->record_chunk("u-1", 0).is_ok());

    auto removed = store->delete_session("u-1");
    ASSERT_TRUE(removed.is_ok());
    EXPECT_TRUE(removed.value());

    auto has = store->has_chunk("u-1", 0);
    ASSERT_TRUE(has.is_ok());
    EXPECT_FALSE(has.value());

    auto again = store->delete_session("u-1");
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value());
}

TEST(SqliteUploadStoreTest, DeleteExpiredSessions) {
    auto store = open_memory_store();
    ASSERT_TRUE(store->insert_session(make_session("old", 2, kNow - std::chrono::minutes(1))).is_ok());
    ASSERT_TRUE(store->insert_session(make_session("fresh", 2, kNow + std::chrono::minutes(1))).is_ok());
    ASSERT_TRUE(store->record_chunk("old", 1).is_ok());

    auto expired = store->delete_expired_sessions(kNow);
    ASSERT_TRUE(expired.is_ok());
    EXPECT_EQ(expired.value(), (std::vector<std::string>{"old"}));

    EXPECT_FALSE(store->find_session("old").value().has_value());
    EXPECT_TRUE(store->find_session("fresh").value().has_value());
    EXPECT_FALSE(store->has_chunk("old", 1).value());
}

TEST(SqliteUploadStoreTest, FileRecordInsertIfAbsent) {
    auto store = open_memory_store();
    auto session = make_session("u-1");

    auto first = store->insert_file_record(make_record(session));
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value().second);
    EXPECT_GT(first.value().first.id, 0);

    auto second = store->insert_file_record(make_record(session));
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value().second);
    EXPECT_EQ(second.value().first.id, first.value().first.id);

    EXPECT_EQ(store->count_file_records().value(), 1);

    auto by_upload = store->find_file_by_upload("u-1");
    ASSERT_TRUE(by_upload.is_ok());
    ASSERT_TRUE(by_upload.value().has_value());
    EXPECT_EQ(by_upload.value()->storage_path, "alice/file_u-1.mp4");
    EXPECT_FALSE(by_upload.value()->folder_id.has_value());

    auto by_path = store->find_file_by_path("alice/file_u-1.mp4");
    ASSERT_TRUE(by_path.is_ok());
    EXPECT_TRUE(by_path.value().has_value());
}

TEST(SqliteUploadStoreTest, ReopeningFileDatabaseKeepsData) {
    const std::string path = ::testing::TempDir() + "chunkup_store_reopen_test.db";
    std::remove(path.c_str());
    {
        auto opened = SqliteUploadStore::open(path);
        ASSERT_TRUE(opened.is_ok());
        ASSERT_TRUE(opened.value()->insert_session(make_session("u-1")).is_ok());
        ASSERT_TRUE(opened.value()->record_chunk("u-1", 4).is_ok());
    }
    {
        auto reopened = SqliteUploadStore::open(path);
        ASSERT_TRUE(reopened.is_ok());
        EXPECT_EQ(reopened.value()->schema_version(), 1);
        auto progress = reopened.value()->progress("u-1");
        ASSERT_TRUE(progress.is_ok());
        EXPECT_EQ(progress.value().uploaded_indices, (std::vector<std::int32_t>{4}));
    }
    std::remove(path.c_str());
}
