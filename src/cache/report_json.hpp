#pragma once
#include "entry.hpp"
#include "query_cache.hpp"
#include <nlohmann/json.hpp>

namespace querycache {

// JSON views of cache results, shared by the CLI and callers that log reports.

inline nlohmann::json report_to_json(const CacheReport& report) {
    return {
        {"total_entries", report.all_time.total_entries},
        {"total_size_mb", static_cast<double>(report.all_time.total_size_bytes) / 1024.0 / 1024.0},
        {"total_size_bytes", report.all_time.total_size_bytes},
        {"total_accesses", report.all_time.total_accesses},
        {"avg_execution_time_ms", report.all_time.avg_execution_time_ms},
        {"today", report.today.date},
        {"today_hits", report.today.hits},
        {"today_misses", report.today.misses},
        {"today_total", report.today.total_queries},
        {"today_hit_rate", report.today.hit_rate},
        {"api_calls_saved", report.today.api_calls_saved}
    };
}

inline nlohmann::json lookup_to_json(const Lookup& lookup) {
    nlohmann::json j = {{"status", lookup_status_to_string(lookup.status)}};
    if (!lookup.hit() || !lookup.entry) return j;

    const CacheEntry& e = *lookup.entry;
    j["question"] = e.original_question;
    j["model"] = e.model_name;
    j["sql_query"] = e.sql_query ? nlohmann::json(*e.sql_query) : nlohmann::json(nullptr);
    j["answer"] = e.answer;
    j["cached"] = true;
    j["cache_metadata"] = {
        {"created_at", e.created_at},
        {"expires_at", e.expires_at},
        {"access_count", e.access_count},
        {"row_count", e.row_count},
        {"columns", lookup.columns},
        {"execution_time_ms", e.execution_time_ms}
    };
    if (lookup.table) {
        j["data"] = {{"columns", lookup.table->columns}, {"rows", lookup.table->rows}};
    }
    return j;
}

inline nlohmann::json maintenance_to_json(const MaintenanceReport& report) {
    return {
        {"invalidated_failures", report.invalidated_failures},
        {"invalidated_generic", report.invalidated_generic},
        {"removed_expired", report.removed_expired},
        {"removed_invalid", report.removed_invalid}
    };
}

} // namespace querycache
