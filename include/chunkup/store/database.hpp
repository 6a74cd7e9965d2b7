#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <sqlite3.h>

namespace chunkup::store {

/// Raised by Database on any SQLite failure; stores convert it to Result errors
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief RAII wrapper over one SQLite connection
 *
 * The connection is opened in serialized (FULLMUTEX) mode. Every statement
 * helper takes the connection mutex, so a single statement never runs inside
 * another thread's open transaction. Multi-statement units of work must
 * additionally hold lock() for their whole duration; the mutex is recursive.
 */
class Database {
public:
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Execute one or more statements without parameters
    void execute(const std::string& sql);

    /// Execute a parameterised statement, returning the number of changed rows
    template<typename... Args>
    int execute(const std::string& sql, Args&&... args) {
        auto guard = lock();
        auto stmt = prepare(sql);
        bind_all(stmt.get(), 1, std::forward<Args>(args)...);
        step_done(stmt.get());
        return changes();
    }

    template<typename T, typename Mapper, typename... Args>
    std::vector<T> query(const std::string& sql, Mapper mapper, Args&&... args) {
        auto guard = lock();
        auto stmt = prepare(sql);
        bind_all(stmt.get(), 1, std::forward<Args>(args)...);

        std::vector<T> rows;
        while (step_row(stmt.get())) {
            rows.push_back(mapper(stmt.get()));
        }
        return rows;
    }

    template<typename T, typename Mapper, typename... Args>
    std::optional<T> query_one(const std::string& sql, Mapper mapper, Args&&... args) {
        auto guard = lock();
        auto stmt = prepare(sql);
        bind_all(stmt.get(), 1, std::forward<Args>(args)...);

        std::optional<T> row;
        if (step_row(stmt.get())) {
            row = mapper(stmt.get());
        }
        return row;
    }

    /// First column of the first row, or 0 when there is no row
    template<typename... Args>
    std::int64_t query_scalar(const std::string& sql, Args&&... args) {
        auto guard = lock();
        auto stmt = prepare(sql);
        bind_all(stmt.get(), 1, std::forward<Args>(args)...);
        return step_row(stmt.get()) ? column_int64(stmt.get(), 0) : 0;
    }

    int changes() const;

    /// Serialises units of work that span several statements
    std::unique_lock<std::recursive_mutex> lock() { return std::unique_lock<std::recursive_mutex>(mutex_); }

    /**
     * @brief RAII write transaction (BEGIN IMMEDIATE)
     *
     * Rolls back in the destructor unless commit() was called.
     */
    class Transaction {
    public:
        explicit Transaction(Database& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        Database& db_;
        bool finished_ = false;
    };

    static int column_int(sqlite3_stmt* stmt, int col);
    static std::int64_t column_int64(sqlite3_stmt* stmt, int col);
    static std::string column_string(sqlite3_stmt* stmt, int col);
    static std::optional<std::string> column_string_opt(sqlite3_stmt* stmt, int col);

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    Statement prepare(const std::string& sql);
    void step_done(sqlite3_stmt* stmt);
    bool step_row(sqlite3_stmt* stmt);

    void bind(sqlite3_stmt* stmt, int index, int value);
    void bind(sqlite3_stmt* stmt, int index, std::int64_t value);
    // int64_t is long on LP64 Linux; keep long long callers working too
    template<typename T>
    std::enable_if_t<std::is_same_v<T, long long> && !std::is_same_v<std::int64_t, long long>>
    bind(sqlite3_stmt* stmt, int index, T value) {
        check_bind(sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value)));
    }
    void bind(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind(sqlite3_stmt* stmt, int index, const char* value);
    void bind(sqlite3_stmt* stmt, int index, std::nullptr_t);
    void bind(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value);

    template<typename T, typename... Rest>
    void bind_all(sqlite3_stmt* stmt, int index, T&& first, Rest&&... rest) {
        bind(stmt, index, std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            bind_all(stmt, index + 1, std::forward<Rest>(rest)...);
        }
    }

    void bind_all(sqlite3_stmt*, int) {}

    void check_bind(int rc);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::recursive_mutex mutex_;
};

} // namespace chunkup::store
