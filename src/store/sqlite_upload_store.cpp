#include "chunkup/store/sqlite_upload_store.hpp"

#include "chunkup/core/encoding.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace chunkup::store {
namespace {

struct Migration {
    int version;
    const char* description;
    const char* sql;
};

const std::array kMigrations = {
    Migration{1, "Upload sessions, chunk ledger and file records", R"SQL(
CREATE TABLE IF NOT EXISTS upload_sessions (
    upload_id          TEXT PRIMARY KEY,
    owner_id           TEXT NOT NULL,
    file_name          TEXT NOT NULL,
    mime_type          TEXT NOT NULL DEFAULT 'application/octet-stream',
    total_size         INTEGER NOT NULL CHECK (total_size > 0),
    total_chunks       INTEGER NOT NULL CHECK (total_chunks > 0),
    storage_file_name  TEXT NOT NULL UNIQUE,
    folder_id          TEXT,
    created_at         INTEGER NOT NULL,
    expires_at         INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_upload_sessions_owner ON upload_sessions(owner_id);
CREATE INDEX IF NOT EXISTS idx_upload_sessions_expires ON upload_sessions(expires_at);

CREATE TABLE IF NOT EXISTS upload_chunks (
    upload_id    TEXT NOT NULL REFERENCES upload_sessions(upload_id) ON DELETE CASCADE,
    chunk_index  INTEGER NOT NULL CHECK (chunk_index >= 0),
    created_at   INTEGER NOT NULL,
    PRIMARY KEY (upload_id, chunk_index)
);

CREATE TABLE IF NOT EXISTS files (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id       TEXT NOT NULL,
    folder_id      TEXT,
    name           TEXT NOT NULL,
    original_name  TEXT NOT NULL,
    mime_type      TEXT NOT NULL,
    size_bytes     INTEGER NOT NULL,
    storage_path   TEXT NOT NULL UNIQUE,
    upload_id      TEXT,
    created_at     INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_files_upload ON files(upload_id);
CREATE INDEX IF NOT EXISTS idx_files_owner ON files(owner_id);
)SQL"},
};

const char* kSessionColumns =
    "upload_id, owner_id, file_name, mime_type, total_size, total_chunks, "
    "storage_file_name, folder_id, created_at, expires_at";

const char* kFileColumns =
    "id, owner_id, folder_id, name, original_name, mime_type, size_bytes, "
    "storage_path, upload_id, created_at";

UploadSession map_session(sqlite3_stmt* stmt) {
    UploadSession session;
    session.upload_id = Database::column_string(stmt, 0);
    session.owner_id = Database::column_string(stmt, 1);
    session.file_name = Database::column_string(stmt, 2);
    session.mime_type = Database::column_string(stmt, 3);
    session.total_size_bytes = Database::column_int64(stmt, 4);
    session.total_chunks = Database::column_int(stmt, 5);
    session.storage_file_name = Database::column_string(stmt, 6);
    session.folder_id = Database::column_string_opt(stmt, 7);
    session.created_at = from_epoch_millis(Database::column_int64(stmt, 8));
    session.expires_at = from_epoch_millis(Database::column_int64(stmt, 9));
    return session;
}

FileRecord map_file(sqlite3_stmt* stmt) {
    FileRecord record;
    record.id = Database::column_int64(stmt, 0);
    record.owner_id = Database::column_string(stmt, 1);
    record.folder_id = Database::column_string_opt(stmt, 2);
    record.name = Database::column_string(stmt, 3);
    record.original_name = Database::column_string(stmt, 4);
    record.mime_type = Database::column_string(stmt, 5);
    record.size_bytes = Database::column_int64(stmt, 6);
    record.storage_path = Database::column_string(stmt, 7);
    record.upload_id = Database::column_string_opt(stmt, 8).value_or("");
    record.created_at = from_epoch_millis(Database::column_int64(stmt, 9));
    return record;
}

template<typename T>
Result<T> storage_error(const char* operation, const std::exception& e) {
    spdlog::error("Store {} failed: {}", operation, e.what());
    return Err<T>(Error::storage(std::string(operation) + " failed: " + e.what()));
}

} // namespace

SqliteUploadStore::SqliteUploadStore(std::unique_ptr<Database> db)
    : db_(std::move(db)) {
}

Result<std::unique_ptr<SqliteUploadStore>> SqliteUploadStore::open(const std::string& path) {
    try {
        auto db = std::make_unique<Database>(path);
        std::unique_ptr<SqliteUploadStore> store(new SqliteUploadStore(std::move(db)));
        store->apply_migrations();
        return Ok(std::move(store));
    } catch (const std::exception& e) {
        return storage_error<std::unique_ptr<SqliteUploadStore>>("open", e);
    }
}

void SqliteUploadStore::apply_migrations() {
    auto lock = db_->lock();
    const int current = schema_version();
    spdlog::info("Upload store schema version: {}, latest: {}", current, kMigrations.size());

    for (const auto& migration : kMigrations) {
        if (migration.version <= current) {
            continue;
        }
        spdlog::info("Applying migration {}: {}", migration.version, migration.description);

        Database::Transaction tx(*db_);
        db_->execute(migration.sql);
        db_->execute("PRAGMA user_version = " + std::to_string(migration.version));
        tx.commit();
    }
}

int SqliteUploadStore::schema_version() {
    auto lock = db_->lock();
    return static_cast<int>(db_->query_scalar("PRAGMA user_version"));
}

// ────────────────────────────────────────────────────────────
// Sessions
// ────────────────────────────────────────────────────────────

Result<void> SqliteUploadStore::insert_session(const UploadSession& session) {
    try {
        auto lock = db_->lock();
        db_->execute(
            std::string("INSERT INTO upload_sessions (") + kSessionColumns +
            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            session.upload_id, session.owner_id, session.file_name, session.mime_type,
            session.total_size_bytes, session.total_chunks, session.storage_file_name,
            session.folder_id, to_epoch_millis(session.created_at), to_epoch_millis(session.expires_at));
        return Ok();
    } catch (const std::exception& e) {
        return storage_error<void>("insert_session", e);
    }
}

Result<std::optional<UploadSession>> SqliteUploadStore::find_session(const std::string& upload_id) {
    try {
        auto lock = db_->lock();
        auto session = db_->query_one<UploadSession>(
            std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE upload_id = ?",
            map_session, upload_id);
        return Ok(std::move(session));
    } catch (const std::exception& e) {
        return storage_error<std::optional<UploadSession>>("find_session", e);
    }
}

Result<bool> SqliteUploadStore::delete_session(const std::string& upload_id) {
    try {
        auto lock = db_->lock();
        Database::Transaction tx(*db_);
        db_->execute("DELETE FROM upload_chunks WHERE upload_id = ?", upload_id);
        const int removed = db_->execute("DELETE FROM upload_sessions WHERE upload_id = ?", upload_id);
        tx.commit();
        return Ok(removed > 0);
    } catch (const std::exception& e) {
        return storage_error<bool>("delete_session", e);
    }
}

Result<std::vector<std::string>> SqliteUploadStore::delete_expired_sessions(TimePoint now) {
    try {
        const auto cutoff = to_epoch_millis(now);
        auto lock = db_->lock();
        Database::Transaction tx(*db_);
        auto expired = db_->query<std::string>(
            "SELECT upload_id FROM upload_sessions WHERE expires_at <= ? ORDER BY expires_at",
            [](sqlite3_stmt* stmt) { return Database::column_string(stmt, 0); },
            cutoff);
        db_->execute(
            "DELETE FROM upload_chunks WHERE upload_id IN "
            "(SELECT upload_id FROM upload_sessions WHERE expires_at <= ?)",
            cutoff);
        db_->execute("DELETE FROM upload_sessions WHERE expires_at <= ?", cutoff);
        tx.commit();
        return Ok(std::move(expired));
    } catch (const std::exception& e) {
        return storage_error<std::vector<std::string>>("delete_expired_sessions", e);
    }
}

// ────────────────────────────────────────────────────────────
// Chunk ledger
// ────────────────────────────────────────────────────────────

std::optional<ChunkProgress> SqliteUploadStore::load_progress(const std::string& upload_id) {
    auto total = db_->query_one<std::int32_t>(
        "SELECT total_chunks FROM upload_sessions WHERE upload_id = ?",
        [](sqlite3_stmt* stmt) { return Database::column_int(stmt, 0); },
        upload_id);
    if (!total) {
        return std::nullopt;
    }

    ChunkProgress progress;
    progress.total_chunks = *total;
    progress.uploaded_indices = db_->query<std::int32_t>(
        "SELECT chunk_index FROM upload_chunks WHERE upload_id = ? ORDER BY chunk_index",
        [](sqlite3_stmt* stmt) { return Database::column_int(stmt, 0); },
        upload_id);
    progress.uploaded_count = static_cast<std::int32_t>(progress.uploaded_indices.size());
    progress.progress_pct = progress.total_chunks > 0
        ? static_cast<double>(progress.uploaded_count) / progress.total_chunks * 100.0
        : 0.0;
    progress.is_complete = progress.uploaded_count == progress.total_chunks;
    return progress;
}

Result<RecordOutcome> SqliteUploadStore::record_chunk(const std::string& upload_id, std::int32_t chunk_index) {
    try {
        auto lock = db_->lock();
        Database::Transaction tx(*db_);

        const auto session_exists = db_->query_scalar(
            "SELECT COUNT(*) FROM upload_sessions WHERE upload_id = ?", upload_id);
        if (session_exists == 0) {
            return Err<RecordOutcome>(Error::not_found("Upload session not found: " + upload_id));
        }

        const int inserted = db_->execute(
            "INSERT OR IGNORE INTO upload_chunks (upload_id, chunk_index, created_at) VALUES (?, ?, ?)",
            upload_id, chunk_index, to_epoch_millis(std::chrono::system_clock::now()));

        auto progress = load_progress(upload_id);
        tx.commit();

        RecordOutcome outcome;
        outcome.progress = std::move(*progress);
        outcome.newly_recorded = inserted > 0;
        return Ok(std::move(outcome));
    } catch (const std::exception& e) {
        return storage_error<RecordOutcome>("record_chunk", e);
    }
}

Result<ChunkProgress> SqliteUploadStore::progress(const std::string& upload_id) {
    try {
        auto lock = db_->lock();
        auto progress = load_progress(upload_id);
        if (!progress) {
            return Err<ChunkProgress>(Error::not_found("Upload session not found: " + upload_id));
        }
        return Ok(std::move(*progress));
    } catch (const std::exception& e) {
        return storage_error<ChunkProgress>("progress", e);
    }
}

Result<bool> SqliteUploadStore::has_chunk(const std::string& upload_id, std::int32_t chunk_index) {
    try {
        auto lock = db_->lock();
        const auto count = db_->query_scalar(
            "SELECT COUNT(*) FROM upload_chunks WHERE upload_id = ? AND chunk_index = ?",
            upload_id, chunk_index);
        return Ok(count > 0);
    } catch (const std::exception& e) {
        return storage_error<bool>("has_chunk", e);
    }
}

// ────────────────────────────────────────────────────────────
// File records
// ────────────────────────────────────────────────────────────

Result<std::pair<FileRecord, bool>> SqliteUploadStore::insert_file_record(const FileRecord& record) {
    try {
        auto lock = db_->lock();
        Database::Transaction tx(*db_);

        const int inserted = db_->execute(
            "INSERT OR IGNORE INTO files (owner_id, folder_id, name, original_name, mime_type, "
            "size_bytes, storage_path, upload_id, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
            record.owner_id, record.folder_id, record.name, record.original_name, record.mime_type,
            record.size_bytes, record.storage_path, record.upload_id, to_epoch_millis(record.created_at));

        auto committed = db_->query_one<FileRecord>(
            std::string("SELECT ") + kFileColumns + " FROM files WHERE storage_path = ?",
            map_file, record.storage_path);
        tx.commit();

        if (!committed) {
            return Err<std::pair<FileRecord, bool>>(
                Error::storage("File record vanished after insert: " + record.storage_path));
        }
        return Ok(std::make_pair(std::move(*committed), inserted > 0));
    } catch (const std::exception& e) {
        return storage_error<std::pair<FileRecord, bool>>("insert_file_record", e);
    }
}

Result<std::optional<FileRecord>> SqliteUploadStore::find_file_by_upload(const std::string& upload_id) {
    try {
        auto lock = db_->lock();
        auto record = db_->query_one<FileRecord>(
            std::string("SELECT ") + kFileColumns + " FROM files WHERE upload_id = ? ORDER BY id LIMIT 1",
            map_file, upload_id);
        return Ok(std::move(record));
    } catch (const std::exception& e) {
        return storage_error<std::optional<FileRecord>>("find_file_by_upload", e);
    }
}

Result<std::optional<FileRecord>> SqliteUploadStore::find_file_by_path(const std::string& storage_path) {
    try {
        auto lock = db_->lock();
        auto record = db_->query_one<FileRecord>(
            std::string("SELECT ") + kFileColumns + " FROM files WHERE storage_path = ?",
            map_file, storage_path);
        return Ok(std::move(record));
    } catch (const std::exception& e) {
        return storage_error<std::optional<FileRecord>>("find_file_by_path", e);
    }
}

Result<std::int64_t> SqliteUploadStore::count_file_records() {
    try {
        auto lock = db_->lock();
        return Ok(db_->query_scalar("SELECT COUNT(*) FROM files"));
    } catch (const std::exception& e) {
        return storage_error<std::int64_t>("count_file_records", e);
    }
}

} // namespace chunkup::store
