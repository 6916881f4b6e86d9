#include "../include/durable_store.hpp"
#include "../../common/include/util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace {
void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int col) {
    auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
    return p ? std::string(p, (size_t)sqlite3_column_bytes(st, col)) : std::string();
}

// Resets the statement on scope exit so a throw never leaves it mid-step.
struct StmtGuard {
    sqlite3_stmt* st;
    explicit StmtGuard(sqlite3_stmt* s) : st(s) { sqlite3_reset(st); sqlite3_clear_bindings(st); }
    ~StmtGuard() { sqlite3_reset(st); }
};
}

SqliteDurableStore::SqliteDurableStore(const std::string& db_path) {
    if (db_path != ":memory:") {
        auto parent = std::filesystem::path(db_path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
    }
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB " + db_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    init();
    prepare_statements();
}

SqliteDurableStore::~SqliteDurableStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteDurableStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS memory (\n"
         "  type TEXT NOT NULL,\n"
         "  key TEXT NOT NULL,\n"
         "  value TEXT NOT NULL,\n"
         "  stored_at INTEGER NOT NULL,\n"
         "  metadata TEXT NOT NULL,\n"
         "  PRIMARY KEY (type, key)\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_memory_type_stored ON memory(type, stored_at, key);");
}

void SqliteDurableStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteDurableStore::prepare_statements() {
    auto prepare = [this](const char* sql, sqlite3_stmt** out, const char* what) {
        if (sqlite3_prepare_v2(db_, sql, -1, out, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("prepare ") + what + " failed: " + sqlite3_errmsg(db_));
        }
    };
    prepare("INSERT OR REPLACE INTO memory (type, key, value, stored_at, metadata) VALUES (?, ?, ?, ?, ?);",
            &upsert_stmt_, "upsert");
    prepare("SELECT key, value, stored_at, metadata FROM memory WHERE type = ? AND key = ?;",
            &get_stmt_, "get");
    prepare("DELETE FROM memory WHERE type = ? AND key = ?;", &delete_stmt_, "delete");
    prepare("SELECT key, value, stored_at, metadata FROM memory\n"
            " WHERE type = ?1\n"
            "   AND (stored_at > ?2 OR (stored_at = ?2 AND key > ?3))\n"
            "   AND (?4 = '' OR substr(key, 1, length(?4)) = ?4)\n"
            " ORDER BY stored_at, key LIMIT ?5;",
            &scan_stmt_, "scan");
    prepare("SELECT COUNT(*), MIN(stored_at), MAX(stored_at) FROM memory WHERE type = ?;",
            &stats_stmt_, "stats");
}

void SqliteDurableStore::close_statements() {
    for (auto** st : {&upsert_stmt_, &get_stmt_, &delete_stmt_, &scan_stmt_, &stats_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

MemoryItem SqliteDurableStore::read_row(sqlite3_stmt* st, MemoryType type, int first_col) {
    MemoryItem item;
    item.type = type;
    item.key = column_text(st, first_col);
    item.value = json::parse(column_text(st, first_col + 1));
    item.stored_at = from_unix_ms(sqlite3_column_int64(st, first_col + 2));
    item.metadata = json::parse(column_text(st, first_col + 3)).get<std::map<std::string, std::string>>();
    return item;
}

void SqliteDurableStore::put(const MemoryItem& item) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtGuard g(upsert_stmt_);
    bind_text(upsert_stmt_, 1, to_string(item.type));
    bind_text(upsert_stmt_, 2, item.key);
    bind_text(upsert_stmt_, 3, item.value.dump());
    sqlite3_bind_int64(upsert_stmt_, 4, to_unix_ms(item.stored_at));
    bind_text(upsert_stmt_, 5, json(item.metadata).dump());
    if (sqlite3_step(upsert_stmt_) != SQLITE_DONE) {
        throw std::runtime_error(std::string("upsert memory failed: ") + sqlite3_errmsg(db_));
    }
}

std::optional<MemoryItem> SqliteDurableStore::get(MemoryType type, const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtGuard g(get_stmt_);
    bind_text(get_stmt_, 1, to_string(type));
    bind_text(get_stmt_, 2, key);
    int rc = sqlite3_step(get_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw std::runtime_error(std::string("get memory failed: ") + sqlite3_errmsg(db_));
    return read_row(get_stmt_, type, 0);
}

bool SqliteDurableStore::erase(MemoryType type, const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtGuard g(delete_stmt_);
    bind_text(delete_stmt_, 1, to_string(type));
    bind_text(delete_stmt_, 2, key);
    if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
        throw std::runtime_error(std::string("delete memory failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

std::vector<MemoryItem> SqliteDurableStore::scan(MemoryType type, const std::optional<ListCursor>& after,
                                                 std::size_t limit, const std::string& key_prefix) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtGuard g(scan_stmt_);
    bind_text(scan_stmt_, 1, to_string(type));
    sqlite3_bind_int64(scan_stmt_, 2, after ? after->stored_at_ms : std::numeric_limits<sqlite3_int64>::min());
    bind_text(scan_stmt_, 3, after ? after->key : std::string());
    bind_text(scan_stmt_, 4, key_prefix);
    sqlite3_bind_int64(scan_stmt_, 5, (sqlite3_int64)limit);

    std::vector<MemoryItem> out;
    int rc;
    while ((rc = sqlite3_step(scan_stmt_)) == SQLITE_ROW) {
        out.push_back(read_row(scan_stmt_, type, 0));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("scan memory failed: ") + sqlite3_errmsg(db_));
    return out;
}

MemoryTypeStats SqliteDurableStore::stats(MemoryType type) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtGuard g(stats_stmt_);
    bind_text(stats_stmt_, 1, to_string(type));
    MemoryTypeStats s;
    if (sqlite3_step(stats_stmt_) != SQLITE_ROW) {
        throw std::runtime_error(std::string("memory stats failed: ") + sqlite3_errmsg(db_));
    }
    s.count = (std::size_t)sqlite3_column_int64(stats_stmt_, 0);
    if (s.count > 0) {
        s.oldest = from_unix_ms(sqlite3_column_int64(stats_stmt_, 1));
        s.newest = from_unix_ms(sqlite3_column_int64(stats_stmt_, 2));
    }
    return s;
}

void SqliteDurableStore::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    exec("DELETE FROM memory;");
}
