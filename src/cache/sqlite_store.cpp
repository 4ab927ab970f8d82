#include "sqlite_store.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace querycache {

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Column list shared by every full-row SELECT; order matches entry_from_stmt.
constexpr const char* kEntryColumns =
    "cache_key, normalized_question, original_question, model_name, sql_query,"
    " answer, result_payload, row_count, column_manifest, created_at,"
    " last_accessed_at, access_count, ttl_seconds, expires_at, size_bytes,"
    " execution_time_ms, valid, invalid_reason";

// Keeps IN (...) lists below SQLITE_MAX_VARIABLE_NUMBER on old builds.
constexpr size_t kDeleteChunk = 500;

std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) {
        return reinterpret_cast<const char*>(v);
    }
    return {};
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_string(stmt, col);
}

std::optional<std::string> column_optional_blob(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const void* blob = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (!blob || bytes <= 0) return std::string{};
    return std::string(static_cast<const char*>(blob), static_cast<size_t>(bytes));
}

uint64_t column_u64(sqlite3_stmt* stmt, int col) {
    sqlite3_int64 v = sqlite3_column_int64(stmt, col);
    return v < 0 ? 0 : static_cast<uint64_t>(v);
}

CacheEntry entry_from_stmt(sqlite3_stmt* stmt) {
    CacheEntry entry;
    entry.cache_key           = column_string(stmt, 0);
    entry.normalized_question = column_string(stmt, 1);
    entry.original_question   = column_string(stmt, 2);
    entry.model_name          = column_string(stmt, 3);
    entry.sql_query           = column_optional_text(stmt, 4);
    entry.answer              = column_string(stmt, 5);
    entry.result_payload      = column_optional_blob(stmt, 6);
    entry.row_count           = column_u64(stmt, 7);
    entry.column_manifest     = column_string(stmt, 8);
    entry.created_at          = column_u64(stmt, 9);
    entry.last_accessed_at    = column_u64(stmt, 10);
    entry.access_count        = column_u64(stmt, 11);
    entry.ttl_seconds         = static_cast<uint32_t>(column_u64(stmt, 12));
    entry.expires_at          = column_u64(stmt, 13);
    entry.size_bytes          = column_u64(stmt, 14);
    entry.execution_time_ms   = sqlite3_column_double(stmt, 15);
    entry.valid               = sqlite3_column_int(stmt, 16) != 0;
    entry.invalid_reason      = column_string(stmt, 17);
    return entry;
}

std::string placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; i++) {
        if (i > 0) out += ',';
        out += '?';
    }
    return out;
}

} // namespace

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("SqliteStore: cannot create directory " +
                                         parent.string() + ": " + ec.message());
            }
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteStore: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        if (path_ != ":memory:") {
            exec("PRAGMA journal_mode=WAL;");
        }
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA temp_store=MEMORY;");
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::string SqliteStore::error_message(const std::string& what) const {
    return "SqliteStore: " + what + ": " + (db_ ? sqlite3_errmsg(db_) : "no connection");
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteStore: " + msg);
    }
}

void SqliteStore::prepare(const std::string& sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(error_message("prepare failed"));
    }
}

void SqliteStore::step_done(sqlite3_stmt* stmt, const char* what) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(error_message(what));
    }
}

void SqliteStore::init_schema() {
    exec(
        "CREATE TABLE IF NOT EXISTS entries ("
        "  cache_key           TEXT PRIMARY KEY,"
        "  normalized_question TEXT NOT NULL,"
        "  original_question   TEXT NOT NULL,"
        "  model_name          TEXT NOT NULL,"
        "  sql_query           TEXT,"
        "  answer              TEXT NOT NULL,"
        "  result_payload      BLOB,"
        "  row_count           INTEGER NOT NULL DEFAULT 0,"
        "  column_manifest     TEXT NOT NULL DEFAULT '',"
        "  created_at          INTEGER NOT NULL,"
        "  last_accessed_at    INTEGER NOT NULL,"
        "  access_count        INTEGER NOT NULL DEFAULT 1,"
        "  ttl_seconds         INTEGER NOT NULL,"
        "  expires_at          INTEGER NOT NULL,"
        "  size_bytes          INTEGER NOT NULL DEFAULT 0,"
        "  execution_time_ms   REAL NOT NULL DEFAULT 0,"
        "  valid               INTEGER NOT NULL DEFAULT 1,"
        "  invalid_reason      TEXT NOT NULL DEFAULT ''"
        ");");

    // Expiration sweeps
    exec("CREATE INDEX IF NOT EXISTS idx_entries_expires_at ON entries(expires_at);");

    // LRU scans
    exec("CREATE INDEX IF NOT EXISTS idx_entries_last_access"
         " ON entries(valid, last_accessed_at, created_at, cache_key);");

    exec(
        "CREATE TABLE IF NOT EXISTS daily_statistics ("
        "  date            TEXT PRIMARY KEY,"
        "  hits            INTEGER NOT NULL DEFAULT 0,"
        "  misses          INTEGER NOT NULL DEFAULT 0,"
        "  total_queries   INTEGER NOT NULL DEFAULT 0,"
        "  hit_rate        REAL NOT NULL DEFAULT 0,"
        "  api_calls_saved INTEGER NOT NULL DEFAULT 0"
        ");");
}

void SqliteStore::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE;");
}

void SqliteStore::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("COMMIT;");
}

void SqliteStore::rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sqlite3_get_autocommit(db_)) {
        exec("ROLLBACK;");
    }
}

std::optional<CacheEntry> SqliteStore::find(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(std::string("SELECT ") + kEntryColumns +
            " FROM entries WHERE cache_key = ? AND valid = 1;", &g.stmt);
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) {
        return entry_from_stmt(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(error_message("find failed"));
    }
    return std::nullopt;
}

void SqliteStore::upsert(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t expires_at = entry.created_at + uint64_t{entry.ttl_seconds} * 1000;

    StmtGuard g;
    prepare(std::string("INSERT OR REPLACE INTO entries (") + kEntryColumns + ")"
            " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", &g.stmt);

    sqlite3_bind_text(g.stmt, 1, entry.cache_key.c_str(),           -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, entry.normalized_question.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, entry.original_question.c_str(),   -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 4, entry.model_name.c_str(),          -1, SQLITE_TRANSIENT);
    if (entry.sql_query) {
        sqlite3_bind_text(g.stmt, 5, entry.sql_query->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(g.stmt, 5);
    }
    sqlite3_bind_text(g.stmt, 6, entry.answer.c_str(), -1, SQLITE_TRANSIENT);
    if (entry.result_payload) {
        sqlite3_bind_blob(g.stmt, 7, entry.result_payload->data(),
                          static_cast<int>(entry.result_payload->size()), SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(g.stmt, 7);
    }
    sqlite3_bind_int64(g.stmt, 8,  static_cast<sqlite3_int64>(entry.row_count));
    sqlite3_bind_text(g.stmt, 9,   entry.column_manifest.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 10, static_cast<sqlite3_int64>(entry.created_at));
    sqlite3_bind_int64(g.stmt, 11, static_cast<sqlite3_int64>(entry.last_accessed_at));
    sqlite3_bind_int64(g.stmt, 12, static_cast<sqlite3_int64>(entry.access_count));
    sqlite3_bind_int64(g.stmt, 13, static_cast<sqlite3_int64>(entry.ttl_seconds));
    sqlite3_bind_int64(g.stmt, 14, static_cast<sqlite3_int64>(expires_at));
    sqlite3_bind_int64(g.stmt, 15, static_cast<sqlite3_int64>(entry.size_bytes));
    sqlite3_bind_double(g.stmt, 16, entry.execution_time_ms);
    sqlite3_bind_int(g.stmt, 17, entry.valid ? 1 : 0);
    sqlite3_bind_text(g.stmt, 18, entry.invalid_reason.c_str(), -1, SQLITE_TRANSIENT);

    step_done(g.stmt, "upsert failed");
}

uint32_t SqliteStore::remove(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t removed = 0;
    for (size_t start = 0; start < keys.size(); start += kDeleteChunk) {
        size_t n = std::min(kDeleteChunk, keys.size() - start);

        StmtGuard g;
        prepare("DELETE FROM entries WHERE cache_key IN (" + placeholders(n) + ");", &g.stmt);
        for (size_t i = 0; i < n; i++) {
            sqlite3_bind_text(g.stmt, static_cast<int>(i + 1),
                              keys[start + i].c_str(), -1, SQLITE_TRANSIENT);
        }
        step_done(g.stmt, "delete failed");
        removed += static_cast<uint32_t>(sqlite3_changes(db_));
    }
    return removed;
}

uint32_t SqliteStore::remove_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("DELETE FROM entries;", &g.stmt);
    step_done(g.stmt, "clear failed");
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

uint32_t SqliteStore::remove_expired(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("DELETE FROM entries WHERE expires_at < ?;", &g.stmt);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(now_ms));
    step_done(g.stmt, "expired delete failed");
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

uint32_t SqliteStore::remove_invalid() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("DELETE FROM entries WHERE valid = 0;", &g.stmt);
    step_done(g.stmt, "invalid delete failed");
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

bool SqliteStore::invalidate(const std::string& key, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("UPDATE entries SET valid = 0, invalid_reason = ?"
            " WHERE cache_key = ? AND valid = 1;", &g.stmt);
    sqlite3_bind_text(g.stmt, 1, reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, key.c_str(),    -1, SQLITE_TRANSIENT);
    step_done(g.stmt, "invalidate failed");
    return sqlite3_changes(db_) > 0;
}

void SqliteStore::touch(const std::string& key, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("UPDATE entries SET access_count = access_count + 1, last_accessed_at = ?"
            " WHERE cache_key = ?;", &g.stmt);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(now_ms));
    sqlite3_bind_text(g.stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    step_done(g.stmt, "touch failed");
}

std::vector<EvictionCandidate> SqliteStore::scan_by_last_access() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("SELECT cache_key, size_bytes FROM entries WHERE valid = 1"
            " ORDER BY last_accessed_at ASC, created_at ASC, cache_key ASC;", &g.stmt);

    std::vector<EvictionCandidate> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        results.push_back({column_string(g.stmt, 0), column_u64(g.stmt, 1)});
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(error_message("LRU scan failed"));
    }
    return results;
}

std::vector<AnswerRow> SqliteStore::scan_answers() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("SELECT cache_key, original_question, answer FROM entries WHERE valid = 1;",
            &g.stmt);

    std::vector<AnswerRow> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        results.push_back({column_string(g.stmt, 0), column_string(g.stmt, 1),
                           column_string(g.stmt, 2)});
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(error_message("answer scan failed"));
    }
    return results;
}

uint64_t SqliteStore::aggregate_size(bool valid_only) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(valid_only
                ? "SELECT COALESCE(SUM(size_bytes), 0) FROM entries WHERE valid = 1;"
                : "SELECT COALESCE(SUM(size_bytes), 0) FROM entries;",
            &g.stmt);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw std::runtime_error(error_message("size query failed"));
    }
    return column_u64(g.stmt, 0);
}

uint64_t SqliteStore::count(bool valid_only) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(valid_only ? "SELECT COUNT(*) FROM entries WHERE valid = 1;"
                       : "SELECT COUNT(*) FROM entries;",
            &g.stmt);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw std::runtime_error(error_message("count failed"));
    }
    return column_u64(g.stmt, 0);
}

std::optional<uint64_t> SqliteStore::entry_size(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("SELECT size_bytes FROM entries WHERE cache_key = ? AND valid = 1;", &g.stmt);
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return column_u64(g.stmt, 0);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(error_message("size lookup failed"));
    }
    return std::nullopt;
}

void SqliteStore::record_lookup(const std::string& date, bool hit) {
    std::lock_guard<std::mutex> lock(mutex_);

    // UPSERT expressions see the pre-update row, so the new counters are
    // spelled out in hit_rate and api_calls_saved.
    StmtGuard g;
    prepare(
        "INSERT INTO daily_statistics"
        " (date, hits, misses, total_queries, hit_rate, api_calls_saved)"
        " VALUES (?1, ?2, ?3, 1, CAST(?2 AS REAL), ?2)"
        " ON CONFLICT(date) DO UPDATE SET"
        "  hits = hits + excluded.hits,"
        "  misses = misses + excluded.misses,"
        "  total_queries = total_queries + 1,"
        "  hit_rate = CAST(hits + excluded.hits AS REAL) / (total_queries + 1),"
        "  api_calls_saved = hits + excluded.hits;",
        &g.stmt);
    sqlite3_bind_text(g.stmt, 1, date.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(g.stmt, 2, hit ? 1 : 0);
    sqlite3_bind_int(g.stmt, 3, hit ? 0 : 1);
    step_done(g.stmt, "statistics update failed");
}

std::optional<DailyStatistic> SqliteStore::daily(const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("SELECT date, hits, misses, total_queries, hit_rate, api_calls_saved"
            " FROM daily_statistics WHERE date = ?;", &g.stmt);
    sqlite3_bind_text(g.stmt, 1, date.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) {
        DailyStatistic stat;
        stat.date            = column_string(g.stmt, 0);
        stat.hits            = column_u64(g.stmt, 1);
        stat.misses          = column_u64(g.stmt, 2);
        stat.total_queries   = column_u64(g.stmt, 3);
        stat.hit_rate        = sqlite3_column_double(g.stmt, 4);
        stat.api_calls_saved = column_u64(g.stmt, 5);
        return stat;
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(error_message("statistics query failed"));
    }
    return std::nullopt;
}

AggregateStatistics SqliteStore::aggregates() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare("SELECT COUNT(*), COALESCE(SUM(size_bytes), 0), COALESCE(SUM(access_count), 0),"
            " COALESCE(AVG(execution_time_ms), 0)"
            " FROM entries WHERE valid = 1;", &g.stmt);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw std::runtime_error(error_message("aggregate query failed"));
    }

    AggregateStatistics stats;
    stats.total_entries         = column_u64(g.stmt, 0);
    stats.total_size_bytes      = column_u64(g.stmt, 1);
    stats.total_accesses        = column_u64(g.stmt, 2);
    stats.avg_execution_time_ms = sqlite3_column_double(g.stmt, 3);
    return stats;
}

} // namespace querycache
