#include "query_cache.hpp"
#include "eviction.hpp"
#include "question_key.hpp"
#include "sqlite_store.hpp"
#include "../util.hpp"
#include <iostream>
#include <stdexcept>

namespace querycache {

QueryCache::QueryCache(std::unique_ptr<CacheStore> store, const CacheConfig& config)
    : store_(std::move(store)),
      config_(config),
      guard_(config.error_markers),
      clock_(epoch_millis) {
    if (!store_) {
        throw std::invalid_argument("QueryCache: store must not be null");
    }
}

QueryCache::~QueryCache() {
    std::cerr << "[cache] Closing " << store_->backend_name() << " cache\n";
}

void QueryCache::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = clock ? std::move(clock) : Clock(epoch_millis);
}

Lookup QueryCache::get(const std::string& question, const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = cache_key(question, model);
    Lookup result;

    try {
        StoreTransaction tx(*store_);
        uint64_t ts = now();
        std::string today = local_date(ts);

        auto entry = store_->find(key);
        if (!entry) {
            store_->record_lookup(today, false);
            tx.commit();
            std::cerr << "[cache] MISS " << short_key(key) << "\n";
            return result;
        }

        if (ts > entry->expires_at) {
            store_->invalidate(key, invalid_reason::kTtlExpired);
            store_->record_lookup(today, false);
            tx.commit();
            std::cerr << "[cache] EXPIRED " << short_key(key) << "\n";
            result.status = LookupStatus::Expired;
            return result;
        }

        std::string signature = guard_.match(entry->answer);
        if (!signature.empty()) {
            store_->invalidate(key, invalid_reason::kErrorSignature);
            store_->record_lookup(today, false);
            tx.commit();
            std::cerr << "[cache] Cached answer matches '" << signature
                      << "', invalidated " << short_key(key) << "\n";
            result.status = LookupStatus::Invalid;
            return result;
        }

        std::optional<ResultTable> table;
        std::vector<std::string> columns;
        try {
            if (entry->result_payload) {
                table = deserialize_table(*entry->result_payload);
            }
            columns = parse_column_manifest(entry->column_manifest);
        } catch (const std::exception& e) {
            store_->invalidate(key, invalid_reason::kCorruptPayload);
            store_->record_lookup(today, false);
            tx.commit();
            std::cerr << "[cache] Failed to deserialize cached data for "
                      << short_key(key) << ": " << e.what() << "\n";
            result.status = LookupStatus::Invalid;
            return result;
        }

        store_->touch(key, ts);
        store_->record_lookup(today, true);
        tx.commit();

        entry->access_count += 1;
        entry->last_accessed_at = ts;

        result.status = LookupStatus::Hit;
        result.entry = std::move(entry);
        result.table = std::move(table);
        result.columns = std::move(columns);
        std::cerr << "[cache] HIT " << short_key(key) << "\n";
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Cache retrieval error: " << e.what() << "\n";
        return Lookup{};
    }
}

bool QueryCache::set(const std::string& question,
                     const std::string& model,
                     const std::optional<std::string>& sql,
                     const std::string& answer,
                     const std::optional<ResultTable>& table,
                     double execution_time_ms,
                     std::optional<uint32_t> ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (trim(answer).empty()) {
        std::cerr << "[cache] Skipping cache for empty answer\n";
        return false;
    }

    std::string signature = guard_.match(answer);
    if (!signature.empty()) {
        std::cerr << "[cache] Skipping cache for error response ('" << signature << "'): "
                  << answer.substr(0, 100) << "\n";
        return false;
    }

    CacheEntry entry;
    entry.normalized_question = normalize_question(question);
    entry.cache_key = cache_key_normalized(entry.normalized_question, model);
    entry.original_question = question;
    entry.model_name = model;
    entry.sql_query = sql;
    entry.answer = answer;
    entry.execution_time_ms = execution_time_ms;
    entry.ttl_seconds = ttl_seconds.value_or(config_.default_ttl);

    if (table && !table->empty()) {
        try {
            entry.result_payload = serialize_table(*table);
            entry.row_count = table->row_count();
            entry.column_manifest = column_manifest(table->columns);
        } catch (const std::exception& e) {
            std::cerr << "[cache] Failed to serialize result table: " << e.what() << "\n";
            return false;
        }
    }

    entry.size_bytes = entry.answer.size() +
                       (entry.sql_query ? entry.sql_query->size() : 0) +
                       (entry.result_payload ? entry.result_payload->size() : 0);

    if (entry.size_bytes > config_.max_entry_size_bytes()) {
        std::cerr << "[cache] Result size (" << format_bytes(entry.size_bytes)
                  << ") exceeds limit (" << format_bytes(config_.max_entry_size_bytes())
                  << "). Not caching.\n";
        return false;
    }
    if (entry.size_bytes > config_.max_size_bytes()) {
        std::cerr << "[cache] Result size (" << format_bytes(entry.size_bytes)
                  << ") exceeds total cache size. Not caching.\n";
        return false;
    }

    try {
        StoreTransaction tx(*store_);
        uint64_t ts = now();

        // A rewrite replaces the old row, so its bytes don't count against the cap.
        uint64_t current = store_->aggregate_size(true);
        uint64_t replaced = store_->entry_size(entry.cache_key).value_or(0);
        current = current > replaced ? current - replaced : 0;

        uint64_t cap = config_.max_size_bytes();
        if (needs_eviction(current, entry.size_bytes, cap)) {
            auto plan = plan_eviction(store_->scan_by_last_access(), current, entry.size_bytes,
                                      cap, config_.eviction_target, entry.cache_key);
            if (!plan.keys.empty()) {
                uint32_t evicted = store_->remove(plan.keys);
                std::cerr << "[cache] Evicted " << evicted << " LRU entries ("
                          << format_bytes(plan.freed_bytes) << ")\n";
            }
        }

        entry.created_at = ts;
        entry.last_accessed_at = ts;
        entry.access_count = 1;
        store_->upsert(entry);
        tx.commit();

        std::cerr << "[cache] Cached result for " << short_key(entry.cache_key)
                  << " (size: " << format_bytes(entry.size_bytes)
                  << ", rows: " << entry.row_count << ")\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to cache result: " << e.what() << "\n";
        return false;
    }
}

bool QueryCache::contains(const std::string& question, const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto entry = store_->find(cache_key(question, model));
        return entry && now() <= entry->expires_at && !guard_.is_failure(entry->answer);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Cache lookup error: " << e.what() << "\n";
        return false;
    }
}

bool QueryCache::invalidate(const std::string& question, const std::string& model,
                            const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        return store_->invalidate(cache_key(question, model), reason);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to invalidate entry: " << e.what() << "\n";
        return false;
    }
}

bool QueryCache::remove(const std::string& question, const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        return store_->remove({cache_key(question, model)}) > 0;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to remove entry: " << e.what() << "\n";
        return false;
    }
}

uint32_t QueryCache::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        uint32_t count = store_->remove_all();
        std::cerr << "[cache] Cleared " << count << " cache entries\n";
        return count;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to clear cache: " << e.what() << "\n";
        return 0;
    }
}

uint32_t QueryCache::clear_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        uint32_t count = store_->remove_expired(now());
        std::cerr << "[cache] Removed " << count << " expired cache entries\n";
        return count;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to clear expired entries: " << e.what() << "\n";
        return 0;
    }
}

MaintenanceReport QueryCache::sweep_locked() {
    MaintenanceReport report;

    StoreTransaction tx(*store_);
    for (const auto& row : store_->scan_answers()) {
        if (guard_.is_failure(row.answer)) {
            if (store_->invalidate(row.cache_key, invalid_reason::kErrorSignature)) {
                report.invalidated_failures++;
            }
        } else if (ErrorGuard::is_generic_answer(row.original_question, row.answer)) {
            if (store_->invalidate(row.cache_key, invalid_reason::kGenericAnswer)) {
                report.invalidated_generic++;
            }
        }
    }
    tx.commit();

    if (report.invalidated_failures + report.invalidated_generic > 0) {
        std::cerr << "[cache] Invalidated " << report.invalidated_failures
                  << " cached error(s) and " << report.invalidated_generic
                  << " generic chart/report answer(s)\n";
    }
    return report;
}

uint32_t QueryCache::sweep_failures() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto report = sweep_locked();
        return report.invalidated_failures + report.invalidated_generic;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failure sweep error: " << e.what() << "\n";
        return 0;
    }
}

MaintenanceReport QueryCache::maintain() {
    std::lock_guard<std::mutex> lock(mutex_);

    MaintenanceReport report;
    try {
        report = sweep_locked();

        StoreTransaction tx(*store_);
        report.removed_expired = store_->remove_expired(now());
        report.removed_invalid = store_->remove_invalid();
        tx.commit();

        std::cerr << "[cache] Maintenance removed " << report.removed_expired
                  << " expired and " << report.removed_invalid << " invalid entries\n";
    } catch (const std::exception& e) {
        std::cerr << "[cache] Maintenance error: " << e.what() << "\n";
    }
    return report;
}

CacheReport QueryCache::get_statistics() {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheReport report;
    report.today.date = local_date(now());
    try {
        report.all_time = store_->aggregates();
        if (auto today = store_->daily(report.today.date)) {
            report.today = *today;
        }
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to get statistics: " << e.what() << "\n";
        CacheReport empty;
        empty.today.date = report.today.date;
        return empty;
    }
    return report;
}

DailyStatistic QueryCache::daily_statistics(const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (auto stat = store_->daily(date)) return *stat;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to get statistics for " << date << ": " << e.what() << "\n";
    }
    DailyStatistic empty;
    empty.date = date;
    return empty;
}

std::unique_ptr<QueryCache> open_query_cache(const CacheConfig& config) {
    if (!config.enabled) {
        std::cerr << "[cache] Caching disabled\n";
        return nullptr;
    }

    std::string path = expand_home(config.path);
    try {
        auto cache = std::make_unique<QueryCache>(std::make_unique<SqliteStore>(path), config);
        std::cerr << "[cache] Cache database initialized at " << path << "\n";
        return cache;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Cache unavailable: " << e.what() << "\n";
        return nullptr;
    }
}

} // namespace querycache
