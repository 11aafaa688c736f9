#pragma once
#include "../conversation.hpp"
#include "sqlite_pool.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct sqlite3; // forward declare

namespace convtrack {

// Row and counter operations available inside one open transaction.
// Obtained only through ConversationStore::transaction(); never outlives it.
class StoreTransaction {
public:
    explicit StoreTransaction(sqlite3* db) : db_(db) {}

    std::optional<Conversation> get(const std::string& sender_id);

    // status=open, creation and last message timestamps = timestamp,
    // closed_timestamp cleared. contact_name replaced only when given.
    // Creates the row if absent.
    void upsert_open(const std::string& sender_id, int64_t timestamp,
                     const std::optional<std::string>& contact_name);

    // Record activity on an existing row without touching its status.
    // Returns false if the sender has no row.
    bool touch(const std::string& sender_id, int64_t timestamp,
               const std::optional<std::string>& contact_name);

    // Row only; counters are the caller's concern.
    CloseResult close(const std::string& sender_id, int64_t timestamp);

    void increment_counter(const std::string& name, int64_t delta);
    void set_counter(const std::string& name, int64_t value);
    Counters read_counters();

    // Number of rows with the given status.
    int64_t count_status(ConversationStatus status);

    // All rows, newest creation_timestamp first.
    std::vector<Conversation> list();

private:
    sqlite3* db_;
};

// Durable conversations + counters tables. Every public operation runs in its
// own transaction; transaction() lets callers compose several operations
// atomically. Failures throw StorageError after rolling back.
class ConversationStore {
public:
    explicit ConversationStore(const std::string& path, int busy_timeout_ms = 5000);

    ConversationStore(const ConversationStore&) = delete;
    ConversationStore& operator=(const ConversationStore&) = delete;

    std::optional<Conversation> get(const std::string& sender_id);
    void upsert_open(const std::string& sender_id, int64_t timestamp,
                     const std::optional<std::string>& contact_name = std::nullopt);
    bool touch(const std::string& sender_id, int64_t timestamp,
               const std::optional<std::string>& contact_name = std::nullopt);
    CloseResult close(const std::string& sender_id, int64_t timestamp);

    void increment_counter(const std::string& name, int64_t delta);
    void set_counter(const std::string& name, int64_t value);
    Counters read_counters();

    std::vector<Conversation> list();

    // Recount rows per status and overwrite the counters:
    // open and closed from the counts, new := open.
    Counters recalculate();

    // Run fn inside one exclusive (BEGIN IMMEDIATE) transaction. Commits when
    // fn returns, rolls back and rethrows when it throws.
    void transaction(const std::function<void(StoreTransaction&)>& fn);

    const std::string& path() const { return pool_.path(); }

private:
    enum class Mode { Read, Write };

    void run(Mode mode, const std::function<void(StoreTransaction&)>& fn);
    void init_schema();

    SqlitePool pool_;
};

} // namespace convtrack
