#pragma once
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

struct sqlite3; // forward declare

namespace convtrack {

// Any failure reported by SQLite: open, prepare, step, busy timeout,
// constraint violation.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Pool of SQLite connections to one database file. Each caller leases its
// own connection for the duration of one transaction, so concurrent callers
// never share a handle and only SQLite's own write lock serializes them.
// The database must be a file: ":memory:" would give every connection a
// separate database.
class SqlitePool {
public:
    // RAII lease; returns the connection to the pool on destruction.
    class Lease {
    public:
        Lease(SqlitePool* pool, sqlite3* db) : pool_(pool), db_(db) {}
        ~Lease();
        Lease(Lease&& other) noexcept : pool_(other.pool_), db_(other.db_) {
            other.pool_ = nullptr;
            other.db_ = nullptr;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        sqlite3* get() const { return db_; }

        // Close instead of returning to the pool (connection state unknown).
        void discard();

    private:
        SqlitePool* pool_;
        sqlite3* db_;
    };

    // busy_timeout_ms bounds how long a writer waits for the database lock
    // before failing with SQLITE_BUSY.
    SqlitePool(std::string path, int busy_timeout_ms, size_t max_idle = 8);
    ~SqlitePool();

    SqlitePool(const SqlitePool&) = delete;
    SqlitePool& operator=(const SqlitePool&) = delete;

    // Throws StorageError if a new connection cannot be opened.
    Lease acquire();

    const std::string& path() const { return path_; }

private:
    sqlite3* open_connection() const;
    void release(sqlite3* db);

    std::string path_;
    int busy_timeout_ms_;
    size_t max_idle_;
    std::mutex mutex_;
    std::vector<sqlite3*> idle_;
};

// Execute a statement without results, throwing StorageError on failure.
void exec_or_throw(sqlite3* db, const char* sql);

} // namespace convtrack
