#pragma once
#include "store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare
struct sqlite3_stmt;

namespace querycache {

class SqliteStore : public CacheStore {
public:
    // Opens (creating if needed) the database at `path`; ":memory:" is
    // accepted. Throws std::runtime_error if the database can not be
    // opened or its schema can not be created.
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }
    const std::string& path() const { return path_; }

    void begin() override;
    void commit() override;
    void rollback() override;

    std::optional<CacheEntry> find(const std::string& key) override;
    void upsert(const CacheEntry& entry) override;
    uint32_t remove(const std::vector<std::string>& keys) override;
    uint32_t remove_all() override;
    uint32_t remove_expired(uint64_t now_ms) override;
    uint32_t remove_invalid() override;
    bool invalidate(const std::string& key, const std::string& reason) override;
    void touch(const std::string& key, uint64_t now_ms) override;

    std::vector<EvictionCandidate> scan_by_last_access() override;
    std::vector<AnswerRow> scan_answers() override;
    uint64_t aggregate_size(bool valid_only = true) override;
    uint64_t count(bool valid_only = true) override;
    std::optional<uint64_t> entry_size(const std::string& key) override;

    void record_lookup(const std::string& date, bool hit) override;
    std::optional<DailyStatistic> daily(const std::string& date) override;
    AggregateStatistics aggregates() override;

private:
    void init_schema();
    void exec(const char* sql);
    void prepare(const std::string& sql, sqlite3_stmt** stmt);
    void step_done(sqlite3_stmt* stmt, const char* what);
    std::string error_message(const std::string& what) const;

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace querycache
