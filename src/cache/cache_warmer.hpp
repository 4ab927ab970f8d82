#pragma once
#include "../config.hpp"
#include "query_cache.hpp"
#include "result_table.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace querycache {

// What running one question through the NL-to-SQL pipeline produced.
struct WarmOutcome {
    std::optional<std::string> sql;
    std::string answer;
    std::optional<ResultTable> table;
    double execution_time_ms = 0.0;
};

struct WarmReport {
    uint32_t cached = 0;
    uint32_t skipped = 0; // already cached
    uint32_t failed = 0;  // runner threw or the cache rejected the write
    uint32_t total = 0;
    uint64_t duration_ms = 0;
};

// Pre-populates the cache with answers to suggested questions.
class CacheWarmer {
public:
    // Runs a question end to end. May throw; the warmer counts that as a failure.
    using Runner = std::function<WarmOutcome(const std::string& question)>;

    // `cache` must outlive the warmer.
    CacheWarmer(QueryCache& cache, Runner runner, std::string model,
                const WarmerConfig& config = {});

    // Warms at most config.max_questions entries of the list (0 = all).
    WarmReport warm(const std::vector<std::string>& questions);

private:
    QueryCache& cache_;
    Runner runner_;
    std::string model_;
    WarmerConfig config_;
};

} // namespace querycache
