#pragma once
#include "../config.hpp"
#include "entry.hpp"
#include "error_guard.hpp"
#include "result_table.hpp"
#include "store.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace querycache {

struct MaintenanceReport {
    uint32_t invalidated_failures = 0; // answers matching an error signature
    uint32_t invalidated_generic = 0;  // placeholder chart/report answers
    uint32_t removed_expired = 0;
    uint32_t removed_invalid = 0;
};

// Persistent question -> (sql, answer, table) cache with TTL expiry,
// size-bounded LRU eviction and error-aware invalidation.
//
// Every public operation runs as one transaction against the store under
// an internal mutex. Storage failures never escape: they are logged and
// degrade to "no cache effect" (get -> Miss, set -> false, counts -> 0).
class QueryCache {
public:
    // Epoch milliseconds
    using Clock = std::function<uint64_t()>;

    // Throws std::invalid_argument if `store` is null.
    QueryCache(std::unique_ptr<CacheStore> store, const CacheConfig& config);
    ~QueryCache();

    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;

    // Read path. Records a hit or a miss in today's statistics.
    Lookup get(const std::string& question, const std::string& model);

    // Write path. Returns false when the write was not cached: failure
    // signature or blank answer, entry over the per-entry or aggregate cap,
    // unserializable table, or a storage error.
    bool set(const std::string& question,
             const std::string& model,
             const std::optional<std::string>& sql,
             const std::string& answer,
             const std::optional<ResultTable>& table,
             double execution_time_ms,
             std::optional<uint32_t> ttl_seconds = std::nullopt);

    // Valid, unexpired and not a failure answer, without touching statistics
    // or access order.
    bool contains(const std::string& question, const std::string& model);

    // Soft-invalidate one entry. Returns true if a valid entry was marked.
    bool invalidate(const std::string& question, const std::string& model,
                    const std::string& reason = invalid_reason::kManual);

    // Hard-delete one entry.
    bool remove(const std::string& question, const std::string& model);

    uint32_t clear_all();
    uint32_t clear_expired();

    // Soft-invalidate valid entries whose answers look like failures or
    // placeholders. Returns the number invalidated.
    uint32_t sweep_failures();

    // sweep_failures(), then clear_expired(), then drop invalid rows.
    MaintenanceReport maintain();

    // All-time aggregates over valid entries plus today's counters.
    CacheReport get_statistics();

    // Counters for a YYYY-MM-DD date; zeroed if nothing was recorded.
    DailyStatistic daily_statistics(const std::string& date);

    void set_clock(Clock clock);

    const CacheConfig& config() const { return config_; }
    CacheStore& store() { return *store_; }

private:
    MaintenanceReport sweep_locked();
    uint64_t now() const { return clock_(); }

    std::unique_ptr<CacheStore> store_;
    CacheConfig config_;
    ErrorGuard guard_;
    Clock clock_;
    std::mutex mutex_;
};

// Open the configured SQLite cache. Returns nullptr (logged) when caching
// is disabled or the store can not be initialized; callers then run
// uncached.
std::unique_ptr<QueryCache> open_query_cache(const CacheConfig& config);

} // namespace querycache
