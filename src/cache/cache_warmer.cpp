#include "cache_warmer.hpp"
#include "../util.hpp"
#include <iostream>

namespace querycache {

CacheWarmer::CacheWarmer(QueryCache& cache, Runner runner, std::string model,
                         const WarmerConfig& config)
    : cache_(cache), runner_(std::move(runner)), model_(std::move(model)), config_(config) {}

WarmReport CacheWarmer::warm(const std::vector<std::string>& questions) {
    WarmReport report;
    uint64_t start = epoch_millis();

    size_t limit = questions.size();
    if (config_.max_questions > 0 && config_.max_questions < limit) {
        limit = config_.max_questions;
    }
    report.total = static_cast<uint32_t>(limit);

    std::cerr << "[warmer] Warming cache with " << limit << " suggested questions...\n";

    for (size_t i = 0; i < limit; i++) {
        const std::string& question = questions[i];
        std::string label = "[" + std::to_string(i + 1) + "/" + std::to_string(limit) + "] " +
                            question.substr(0, 50);

        if (cache_.contains(question, model_)) {
            std::cerr << "[warmer] " << label << ": already cached\n";
            report.skipped++;
            continue;
        }

        WarmOutcome outcome;
        try {
            outcome = runner_(question);
        } catch (const std::exception& e) {
            std::cerr << "[warmer] " << label << ": failed: " << e.what() << "\n";
            report.failed++;
            continue;
        }

        if (cache_.set(question, model_, outcome.sql, outcome.answer, outcome.table,
                       outcome.execution_time_ms)) {
            report.cached++;
        } else {
            std::cerr << "[warmer] " << label << ": not cached\n";
            report.failed++;
        }
    }

    report.duration_ms = epoch_millis() - start;
    std::cerr << "[warmer] Completed in " << report.duration_ms << "ms - cached: "
              << report.cached << ", skipped: " << report.skipped
              << ", failed: " << report.failed << "\n";
    return report;
}

} // namespace querycache
