#include "conversation_store.hpp"

#include <sqlite3.h>
#include <iostream>

namespace convtrack {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }
}

static void step_done(sqlite3* db, StmtGuard& g) {
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("step failed: ") + sqlite3_errmsg(db));
    }
}

// SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
static bool step_row(sqlite3* db, StmtGuard& g) {
    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError(std::string("step failed: ") + sqlite3_errmsg(db));
}

// Bound by byte length so embedded NULs survive; ids are compared whole.
static void bind_text(StmtGuard& g, int col, const std::string& s) {
    sqlite3_bind_text(g.stmt, col, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void bind_optional_text(StmtGuard& g, int col, const std::optional<std::string>& s) {
    if (s) {
        bind_text(g, col, *s);
    } else {
        sqlite3_bind_null(g.stmt, col);
    }
}

// Columns: sender_id, status, creation_timestamp, closed_timestamp,
// contact_name, last_message_timestamp (0-5).
static constexpr const char* kSelectColumns =
    "SELECT sender_id, status, creation_timestamp, closed_timestamp,"
    " contact_name, last_message_timestamp FROM conversations";

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const auto* v = sqlite3_column_text(stmt, col);
    if (!v) return {};
    return std::string(reinterpret_cast<const char*>(v),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

static Conversation conversation_from_stmt(sqlite3_stmt* stmt) {
    Conversation c;
    c.sender_id = column_string(stmt, 0);
    if (auto* v = sqlite3_column_text(stmt, 1)) c.status = status_from_string(reinterpret_cast<const char*>(v));
    c.creation_timestamp = sqlite3_column_int64(stmt, 2);
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        c.closed_timestamp = sqlite3_column_int64(stmt, 3);
    }
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) c.contact_name = column_string(stmt, 4);
    c.last_message_timestamp = sqlite3_column_int64(stmt, 5);
    return c;
}

// ── StoreTransaction ─────────────────────────────────────────────

std::optional<Conversation> StoreTransaction::get(const std::string& sender_id) {
    std::string sql = std::string(kSelectColumns) + " WHERE sender_id = ?;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    bind_text(g, 1, sender_id);
    if (!step_row(db_, g)) return std::nullopt;
    return conversation_from_stmt(g.stmt);
}

void StoreTransaction::upsert_open(const std::string& sender_id, int64_t timestamp,
                                   const std::optional<std::string>& contact_name) {
    const char* sql =
        "INSERT INTO conversations (sender_id, status, creation_timestamp,"
        "  closed_timestamp, contact_name, last_message_timestamp)"
        " VALUES (?, 'open', ?, NULL, ?, ?)"
        " ON CONFLICT(sender_id) DO UPDATE SET"
        "  status = 'open',"
        "  creation_timestamp = excluded.creation_timestamp,"
        "  closed_timestamp = NULL,"
        "  contact_name = COALESCE(excluded.contact_name, conversations.contact_name),"
        "  last_message_timestamp = excluded.last_message_timestamp;";
    StmtGuard g;
    prepare(db_, sql, g);
    bind_text(g, 1, sender_id);
    sqlite3_bind_int64(g.stmt, 2, timestamp);
    bind_optional_text(g, 3, contact_name);
    sqlite3_bind_int64(g.stmt, 4, timestamp);
    step_done(db_, g);
}

bool StoreTransaction::touch(const std::string& sender_id, int64_t timestamp,
                             const std::optional<std::string>& contact_name) {
    // Deliveries can arrive out of order; keep the newest timestamp.
    const char* sql =
        "UPDATE conversations SET"
        "  last_message_timestamp = MAX(last_message_timestamp, ?),"
        "  contact_name = COALESCE(?, contact_name)"
        " WHERE sender_id = ?;";
    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_int64(g.stmt, 1, timestamp);
    bind_optional_text(g, 2, contact_name);
    bind_text(g, 3, sender_id);
    step_done(db_, g);
    return sqlite3_changes(db_) > 0;
}

CloseResult StoreTransaction::close(const std::string& sender_id, int64_t timestamp) {
    auto current = get(sender_id);
    if (!current) return CloseResult::NotFound;
    if (current->status == ConversationStatus::Closed) return CloseResult::AlreadyClosed;

    const char* sql =
        "UPDATE conversations SET status = 'closed', closed_timestamp = ?"
        " WHERE sender_id = ?;";
    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_int64(g.stmt, 1, timestamp);
    bind_text(g, 2, sender_id);
    step_done(db_, g);
    return CloseResult::Closed;
}

void StoreTransaction::increment_counter(const std::string& name, int64_t delta) {
    const char* sql =
        "INSERT INTO counters (counter_name, value) VALUES (?, ?)"
        " ON CONFLICT(counter_name) DO UPDATE SET value = value + excluded.value;";
    StmtGuard g;
    prepare(db_, sql, g);
    bind_text(g, 1, name);
    sqlite3_bind_int64(g.stmt, 2, delta);
    step_done(db_, g);
}

void StoreTransaction::set_counter(const std::string& name, int64_t value) {
    const char* sql =
        "INSERT INTO counters (counter_name, value) VALUES (?, ?)"
        " ON CONFLICT(counter_name) DO UPDATE SET value = excluded.value;";
    StmtGuard g;
    prepare(db_, sql, g);
    bind_text(g, 1, name);
    sqlite3_bind_int64(g.stmt, 2, value);
    step_done(db_, g);
}

Counters StoreTransaction::read_counters() {
    StmtGuard g;
    prepare(db_, "SELECT counter_name, value FROM counters;", g);

    Counters counters;
    while (step_row(db_, g)) {
        const auto* raw = sqlite3_column_text(g.stmt, 0);
        if (!raw) continue;
        std::string name = reinterpret_cast<const char*>(raw);
        int64_t value = sqlite3_column_int64(g.stmt, 1);
        if (name == kNewConversationCount)         counters.new_conversation_count = value;
        else if (name == kOpenConversationCount)   counters.open_conversation_count = value;
        else if (name == kClosedConversationCount) counters.closed_conversation_count = value;
    }
    return counters;
}

int64_t StoreTransaction::count_status(ConversationStatus status) {
    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM conversations WHERE status = ?;", g);
    bind_text(g, 1, status_to_string(status));
    if (!step_row(db_, g)) return 0;
    return sqlite3_column_int64(g.stmt, 0);
}

std::vector<Conversation> StoreTransaction::list() {
    std::string sql = std::string(kSelectColumns) +
                      " ORDER BY creation_timestamp DESC, sender_id ASC;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);

    std::vector<Conversation> rows;
    while (step_row(db_, g)) {
        rows.push_back(conversation_from_stmt(g.stmt));
    }
    return rows;
}

// ── ConversationStore ────────────────────────────────────────────

ConversationStore::ConversationStore(const std::string& path, int busy_timeout_ms)
    : pool_(path, busy_timeout_ms)
{
    init_schema();
}

void ConversationStore::init_schema() {
    auto lease = pool_.acquire();
    sqlite3* db = lease.get();

    exec_or_throw(db,
        "CREATE TABLE IF NOT EXISTS conversations ("
        "  sender_id              TEXT PRIMARY KEY,"
        "  status                 TEXT NOT NULL CHECK (status IN ('open', 'closed')),"
        "  creation_timestamp     INTEGER NOT NULL,"
        "  closed_timestamp       INTEGER,"
        "  contact_name           TEXT,"
        "  last_message_timestamp INTEGER NOT NULL DEFAULT 0"
        ");");

    exec_or_throw(db,
        "CREATE TABLE IF NOT EXISTS counters ("
        "  counter_name TEXT PRIMARY KEY,"
        "  value        INTEGER NOT NULL DEFAULT 0"
        ");");

    exec_or_throw(db,
        "CREATE INDEX IF NOT EXISTS idx_conversations_status"
        " ON conversations(status);");

    // Created once; a restart must never reset existing values.
    exec_or_throw(db,
        "INSERT OR IGNORE INTO counters (counter_name, value) VALUES"
        " ('new_conversation_count', 0),"
        " ('open_conversation_count', 0),"
        " ('closed_conversation_count', 0);");
}

void ConversationStore::run(Mode mode, const std::function<void(StoreTransaction&)>& fn) {
    auto lease = pool_.acquire();
    sqlite3* db = lease.get();

    exec_or_throw(db, mode == Mode::Write ? "BEGIN IMMEDIATE;" : "BEGIN;");
    try {
        StoreTransaction tx(db);
        fn(tx);
        exec_or_throw(db, "COMMIT;");
    } catch (const std::exception& e) {
        if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK &&
            !sqlite3_get_autocommit(db)) {
            // Still inside a transaction we cannot end: do not reuse the handle.
            lease.discard();
        }
        std::cerr << "[store] Transaction rolled back: " << e.what() << "\n";
        throw;
    }
}

void ConversationStore::transaction(const std::function<void(StoreTransaction&)>& fn) {
    run(Mode::Write, fn);
}

std::optional<Conversation> ConversationStore::get(const std::string& sender_id) {
    std::optional<Conversation> result;
    run(Mode::Read, [&](StoreTransaction& tx) { result = tx.get(sender_id); });
    return result;
}

void ConversationStore::upsert_open(const std::string& sender_id, int64_t timestamp,
                                    const std::optional<std::string>& contact_name) {
    run(Mode::Write, [&](StoreTransaction& tx) {
        tx.upsert_open(sender_id, timestamp, contact_name);
    });
}

bool ConversationStore::touch(const std::string& sender_id, int64_t timestamp,
                              const std::optional<std::string>& contact_name) {
    bool found = false;
    run(Mode::Write, [&](StoreTransaction& tx) {
        found = tx.touch(sender_id, timestamp, contact_name);
    });
    return found;
}

CloseResult ConversationStore::close(const std::string& sender_id, int64_t timestamp) {
    CloseResult result = CloseResult::NotFound;
    run(Mode::Write, [&](StoreTransaction& tx) { result = tx.close(sender_id, timestamp); });
    return result;
}

void ConversationStore::increment_counter(const std::string& name, int64_t delta) {
    run(Mode::Write, [&](StoreTransaction& tx) { tx.increment_counter(name, delta); });
}

void ConversationStore::set_counter(const std::string& name, int64_t value) {
    run(Mode::Write, [&](StoreTransaction& tx) { tx.set_counter(name, value); });
}

Counters ConversationStore::read_counters() {
    Counters counters;
    run(Mode::Read, [&](StoreTransaction& tx) { counters = tx.read_counters(); });
    return counters;
}

std::vector<Conversation> ConversationStore::list() {
    std::vector<Conversation> rows;
    run(Mode::Read, [&](StoreTransaction& tx) { rows = tx.list(); });
    return rows;
}

Counters ConversationStore::recalculate() {
    Counters counters;
    run(Mode::Write, [&](StoreTransaction& tx) {
        counters.open_conversation_count   = tx.count_status(ConversationStatus::Open);
        counters.closed_conversation_count = tx.count_status(ConversationStatus::Closed);
        counters.new_conversation_count    = counters.open_conversation_count;

        tx.set_counter(kOpenConversationCount,   counters.open_conversation_count);
        tx.set_counter(kClosedConversationCount, counters.closed_conversation_count);
        tx.set_counter(kNewConversationCount,    counters.new_conversation_count);
    });
    return counters;
}

} // namespace convtrack
