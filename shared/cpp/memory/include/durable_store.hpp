#pragma once
#include "memory_types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Persistent home of the four durable memory types, keyed by (type, key).
class DurableStore {
public:
    virtual ~DurableStore() = default;

    // Insert or overwrite.
    virtual void put(const MemoryItem& item) = 0;
    virtual std::optional<MemoryItem> get(MemoryType type, const std::string& key) = 0;
    virtual bool erase(MemoryType type, const std::string& key) = 0;
    // Up to limit items of one type in (stored_at, key) order, strictly after
    // `after` when given, restricted to keys starting with key_prefix.
    virtual std::vector<MemoryItem> scan(MemoryType type, const std::optional<ListCursor>& after,
                                         std::size_t limit, const std::string& key_prefix) = 0;
    virtual MemoryTypeStats stats(MemoryType type) = 0;
};

// SQLite-backed DurableStore. Pass ":memory:" for a private in-memory DB.
// One connection, statements serialized by a mutex.
class SqliteDurableStore : public DurableStore {
public:
    explicit SqliteDurableStore(const std::string& db_path);
    ~SqliteDurableStore() override;
    SqliteDurableStore(const SqliteDurableStore&) = delete;
    SqliteDurableStore& operator=(const SqliteDurableStore&) = delete;

    void put(const MemoryItem& item) override;
    std::optional<MemoryItem> get(MemoryType type, const std::string& key) override;
    bool erase(MemoryType type, const std::string& key) override;
    std::vector<MemoryItem> scan(MemoryType type, const std::optional<ListCursor>& after,
                                 std::size_t limit, const std::string& key_prefix) override;
    MemoryTypeStats stats(MemoryType type) override;

    void reset();

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    MemoryItem read_row(struct sqlite3_stmt* st, MemoryType type, int first_col);

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* upsert_stmt_ {nullptr};
    struct sqlite3_stmt* get_stmt_ {nullptr};
    struct sqlite3_stmt* delete_stmt_ {nullptr};
    struct sqlite3_stmt* scan_stmt_ {nullptr};
    struct sqlite3_stmt* stats_stmt_ {nullptr};
};
