#include "eviction.hpp"
#include <cmath>

namespace querycache {

bool needs_eviction(uint64_t current, uint64_t incoming, uint64_t cap) {
    return current + incoming > cap;
}

uint64_t eviction_target(uint64_t cap, double ratio) {
    if (ratio >= 1.0) return cap;
    if (ratio <= 0.0) return 0;
    return static_cast<uint64_t>(std::floor(static_cast<double>(cap) * ratio));
}

EvictionPlan plan_eviction(const std::vector<EvictionCandidate>& lru_order,
                           uint64_t current, uint64_t incoming,
                           uint64_t cap, double ratio,
                           const std::string& protected_key) {
    EvictionPlan plan;
    if (!needs_eviction(current, incoming, cap)) return plan;

    uint64_t target = eviction_target(cap, ratio);
    auto over_target = [&]() {
        uint64_t remaining = current > plan.freed_bytes ? current - plan.freed_bytes : 0;
        return remaining + incoming > target;
    };

    for (const auto& candidate : lru_order) {
        if (!over_target()) break;
        if (!protected_key.empty() && candidate.cache_key == protected_key) continue;
        plan.keys.push_back(candidate.cache_key);
        plan.freed_bytes += candidate.size_bytes;
    }

    plan.reaches_target = !over_target();
    return plan;
}

} // namespace querycache
