#include "chunkup/store/database.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::store {

Database::Database(const std::string& path) : path_(path) {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);

    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw DatabaseError("Failed to open database " + path + ": " + error);
    }

    execute("PRAGMA busy_timeout = 30000");
    execute("PRAGMA foreign_keys = ON");
    execute("PRAGMA synchronous = NORMAL");
    if (path != ":memory:") {
        execute("PRAGMA journal_mode = WAL");
    }

    spdlog::info("Database opened: {}", path);
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
        spdlog::debug("Database closed: {}", path_);
    }
}

void Database::execute(const std::string& sql) {
    auto guard = lock();
    char* error_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        throw DatabaseError("SQL execution failed: " + error + " (SQL: " + sql + ")");
    }
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

Database::Statement Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to prepare statement: " +
                            std::string(sqlite3_errmsg(db_)) + " (SQL: " + sql + ")");
    }
    return Statement(stmt);
}

void Database::step_done(sqlite3_stmt* stmt) {
    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw DatabaseError("Failed to execute statement: " + std::string(sqlite3_errmsg(db_)));
    }
}

bool Database::step_row(sqlite3_stmt* stmt) {
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseError("Failed to step statement: " + std::string(sqlite3_errmsg(db_)));
}

void Database::check_bind(int rc) {
    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to bind parameter: " + std::string(sqlite3_errmsg(db_)));
    }
}

void Database::bind(sqlite3_stmt* stmt, int index, int value) {
    check_bind(sqlite3_bind_int(stmt, index, value));
}

void Database::bind(sqlite3_stmt* stmt, int index, std::int64_t value) {
    check_bind(sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value)));
}

void Database::bind(sqlite3_stmt* stmt, int index, const std::string& value) {
    check_bind(sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
}

void Database::bind(sqlite3_stmt* stmt, int index, const char* value) {
    if (value) {
        check_bind(sqlite3_bind_text(stmt, index, value, -1, SQLITE_TRANSIENT));
    } else {
        check_bind(sqlite3_bind_null(stmt, index));
    }
}

void Database::bind(sqlite3_stmt* stmt, int index, std::nullptr_t) {
    check_bind(sqlite3_bind_null(stmt, index));
}

void Database::bind(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        bind(stmt, index, *value);
    } else {
        bind(stmt, index, nullptr);
    }
}

int Database::column_int(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int(stmt, col);
}

std::int64_t Database::column_int64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

std::string Database::column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (text) {
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
    }
    return {};
}

std::optional<std::string> Database::column_string_opt(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_string(stmt, col);
}

// ────────────────────────────────────────────────────────────
// Transaction
// ────────────────────────────────────────────────────────────

Database::Transaction::Transaction(Database& db) : db_(db) {
    db_.execute("BEGIN IMMEDIATE");
}

Database::Transaction::~Transaction() {
    if (!finished_) {
        try {
            db_.execute("ROLLBACK");
        } catch (const DatabaseError& e) {
            spdlog::error("Rollback failed: {}", e.what());
        }
    }
}

void Database::Transaction::commit() {
    db_.execute("COMMIT");
    finished_ = true;
}

} // namespace chunkup::store
