#include "sqlite_pool.hpp"

#include <sqlite3.h>
#include <filesystem>

namespace convtrack {

void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StorageError(msg);
    }
}

SqlitePool::Lease::~Lease() {
    if (pool_ && db_) pool_->release(db_);
}

void SqlitePool::Lease::discard() {
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
}

SqlitePool::SqlitePool(std::string path, int busy_timeout_ms, size_t max_idle)
    : path_(std::move(path))
    , busy_timeout_ms_(busy_timeout_ms)
    , max_idle_(max_idle)
{
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StorageError("cannot create database directory " + parent.string() +
                               ": " + ec.message());
        }
    }

    // Open one connection eagerly so a bad path fails at startup.
    release(open_connection());
}

SqlitePool::~SqlitePool() {
    for (auto* db : idle_) sqlite3_close(db);
    idle_.clear();
}

sqlite3* SqlitePool::open_connection() const {
    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(path_.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "unknown error";
        if (db) sqlite3_close(db);
        throw StorageError("failed to open database " + path_ + ": " + err);
    }

    sqlite3_busy_timeout(db, busy_timeout_ms_);
    try {
        exec_or_throw(db, "PRAGMA journal_mode=WAL;");
        exec_or_throw(db, "PRAGMA synchronous=NORMAL;");
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

SqlitePool::Lease SqlitePool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            sqlite3* db = idle_.back();
            idle_.pop_back();
            return Lease(this, db);
        }
    }
    return Lease(this, open_connection());
}

void SqlitePool::release(sqlite3* db) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < max_idle_) {
            idle_.push_back(db);
            return;
        }
    }
    sqlite3_close(db);
}

} // namespace convtrack
