#pragma once
#include "entry.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace querycache {

// Durable backing store for cache entries and daily statistics.
// Implementations throw std::runtime_error on storage failure; callers
// decide how to degrade. Every method is atomic on its own; begin/commit
// group several calls into one unit.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::string backend_name() const = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    // Valid entry by key. Soft-invalidated rows are never returned.
    virtual std::optional<CacheEntry> find(const std::string& key) = 0;

    // Insert or replace by cache_key. expires_at is always recomputed as
    // created_at + ttl_seconds.
    virtual void upsert(const CacheEntry& entry) = 0;

    // Hard-delete a batch of keys. Returns rows removed.
    virtual uint32_t remove(const std::vector<std::string>& keys) = 0;

    virtual uint32_t remove_all() = 0;

    // Hard-delete rows with expires_at < now_ms.
    virtual uint32_t remove_expired(uint64_t now_ms) = 0;

    // Hard-delete soft-invalidated rows.
    virtual uint32_t remove_invalid() = 0;

    // Mark valid=false with a reason. Returns true if a valid row changed.
    virtual bool invalidate(const std::string& key, const std::string& reason) = 0;

    // Bump access_count and set last_accessed_at.
    virtual void touch(const std::string& key, uint64_t now_ms) = 0;

    // Valid entries ordered by last_accessed_at, created_at, cache_key ascending.
    virtual std::vector<EvictionCandidate> scan_by_last_access() = 0;

    // Valid entries' answers, for signature sweeps.
    virtual std::vector<AnswerRow> scan_answers() = 0;

    virtual uint64_t aggregate_size(bool valid_only = true) = 0;

    virtual uint64_t count(bool valid_only = true) = 0;

    // Size of a valid entry, nullopt if absent or invalid.
    virtual std::optional<uint64_t> entry_size(const std::string& key) = 0;

    // Increment the hit or miss counter for `date`, recomputing
    // total_queries, hit_rate and api_calls_saved in the same statement.
    virtual void record_lookup(const std::string& date, bool hit) = 0;

    virtual std::optional<DailyStatistic> daily(const std::string& date) = 0;

    virtual AggregateStatistics aggregates() = 0;
};

// Rolls back unless commit() was called.
class StoreTransaction {
public:
    explicit StoreTransaction(CacheStore& store) : store_(store) { store_.begin(); }
    ~StoreTransaction() {
        if (!done_) {
            try {
                store_.rollback();
            } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
                // Nothing left to undo if the connection itself failed.
            }
        }
    }

    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    void commit() {
        store_.commit();
        done_ = true;
    }

private:
    CacheStore& store_;
    bool done_ = false;
};

} // namespace querycache
