#pragma once
#include "result_table.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace querycache {

// One row of the entries table. Timestamps are epoch milliseconds.
struct CacheEntry {
    std::string cache_key;
    std::string normalized_question;
    std::string original_question;
    std::string model_name;
    std::optional<std::string> sql_query;
    std::string answer;
    std::optional<std::string> result_payload; // serialized ResultTable
    uint64_t row_count = 0;
    std::string column_manifest;               // JSON array of column names
    uint64_t created_at = 0;
    uint64_t last_accessed_at = 0;
    uint64_t access_count = 1;
    uint32_t ttl_seconds = 0;
    uint64_t expires_at = 0;                   // recomputed by the store on upsert
    uint64_t size_bytes = 0;
    double execution_time_ms = 0.0;
    bool valid = true;
    std::string invalid_reason;
};

// Minimal projection used for LRU selection.
struct EvictionCandidate {
    std::string cache_key;
    uint64_t size_bytes = 0;
};

// Minimal projection used by the maintenance sweep.
struct AnswerRow {
    std::string cache_key;
    std::string original_question;
    std::string answer;
};

struct DailyStatistic {
    std::string date; // YYYY-MM-DD
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t total_queries = 0;
    double hit_rate = 0.0;
    uint64_t api_calls_saved = 0;
};

// All-time aggregates over valid entries.
struct AggregateStatistics {
    uint64_t total_entries = 0;
    uint64_t total_size_bytes = 0;
    uint64_t total_accesses = 0;
    double avg_execution_time_ms = 0.0;
};

struct CacheReport {
    AggregateStatistics all_time;
    DailyStatistic today;
};

// Soft-invalidation reasons recorded in the store.
namespace invalid_reason {
constexpr const char* kTtlExpired = "ttl_expired";
constexpr const char* kErrorSignature = "error_signature";
constexpr const char* kGenericAnswer = "generic_answer";
constexpr const char* kCorruptPayload = "corrupt_payload";
constexpr const char* kManual = "manual";
} // namespace invalid_reason

enum class LookupStatus { Hit, Miss, Expired, Invalid };

inline std::string lookup_status_to_string(LookupStatus status) {
    switch (status) {
        case LookupStatus::Hit:     return "hit";
        case LookupStatus::Miss:    return "miss";
        case LookupStatus::Expired: return "expired";
        case LookupStatus::Invalid: return "invalid";
    }
    return "miss";
}

// Outcome of a read. `entry` and `table` are only set for Hit.
struct Lookup {
    LookupStatus status = LookupStatus::Miss;
    std::optional<CacheEntry> entry;
    std::optional<ResultTable> table;
    std::vector<std::string> columns;

    bool hit() const { return status == LookupStatus::Hit; }
};

} // namespace querycache
