/**
 * @file sqlite_upload_store.hpp
 * @brief Durable sessions, chunk ledger and file records in SQLite
 *
 * WHY THIS FILE EXISTS:
 * Upload progress has to survive a coordinator restart, and several request
 * threads record chunks for the same session at once. A single SQLite file
 * gives both without running a separate database server.
 *
 * WHAT IT DOES:
 * - Applies schema migrations on open
 * - Records chunk indices idempotently and reports progress in the same
 *   transaction, so exactly one caller observes completion
 * - Stores file records with insert-if-absent semantics
 * - Serializes every statement on the shared connection lock
 *
 * EXAMPLE:
 * auto store = SqliteUploadStore::open(":memory:");
 * store.value()->insert_session(session);
 * auto outcome = store.value()->record_chunk(session.upload_id, 0);
 */

#pragma once

#include "chunkup/store/database.hpp"
#include "chunkup/store/upload_store.hpp"

#include <memory>
#include <string>

namespace chunkup::store {

/**
 * @brief UploadStore backed by a single SQLite database
 *
 * Schema (see migrations in the .cpp):
 *   upload_sessions(upload_id PK, ..., storage_file_name UNIQUE, expires_at)
 *   upload_chunks(upload_id, chunk_index) PK, cascades from upload_sessions
 *   files(id PK, ..., storage_path UNIQUE, upload_id)
 *
 * Pass ":memory:" for a private in-process database.
 */
class SqliteUploadStore : public UploadStore {
public:
    /// Opens the database and applies pending migrations
    static Result<std::unique_ptr<SqliteUploadStore>> open(const std::string& path);

    Result<void> insert_session(const UploadSession& session) override;
    Result<std::optional<UploadSession>> find_session(const std::string& upload_id) override;
    Result<bool> delete_session(const std::string& upload_id) override;
    Result<std::vector<std::string>> delete_expired_sessions(TimePoint now) override;

    Result<RecordOutcome> record_chunk(const std::string& upload_id, std::int32_t chunk_index) override;
    Result<ChunkProgress> progress(const std::string& upload_id) override;
    Result<bool> has_chunk(const std::string& upload_id, std::int32_t chunk_index) override;

    Result<std::pair<FileRecord, bool>> insert_file_record(const FileRecord& record) override;
    Result<std::optional<FileRecord>> find_file_by_upload(const std::string& upload_id) override;
    Result<std::optional<FileRecord>> find_file_by_path(const std::string& storage_path) override;
    Result<std::int64_t> count_file_records() override;

    /// Current schema version (PRAGMA user_version)
    int schema_version();

private:
    explicit SqliteUploadStore(std::unique_ptr<Database> db);

    void apply_migrations();

    /// Ledger progress; caller must hold the database lock
    std::optional<ChunkProgress> load_progress(const std::string& upload_id);

    std::unique_ptr<Database> db_;
};

} // namespace chunkup::store
