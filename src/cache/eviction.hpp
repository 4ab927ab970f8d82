#pragma once
#include "entry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace querycache {

struct EvictionPlan {
    std::vector<std::string> keys; // in eviction order
    uint64_t freed_bytes = 0;
    bool reaches_target = true;    // false if every candidate was taken and it still wasn't enough
};

// True when writing `incoming` bytes on top of `current` would exceed `cap`.
bool needs_eviction(uint64_t current, uint64_t incoming, uint64_t cap);

// Size to evict down to: cap * ratio, rounded down.
uint64_t eviction_target(uint64_t cap, double ratio);

// Walk `lru_order` (least recently used first) and take entries until
// current - freed + incoming <= eviction_target(cap, ratio). `protected_key`
// (the key being rewritten) is never taken. Returns an empty plan when no
// eviction is needed.
EvictionPlan plan_eviction(const std::vector<EvictionCandidate>& lru_order,
                           uint64_t current, uint64_t incoming,
                           uint64_t cap, double ratio,
                           const std::string& protected_key = {});

} // namespace querycache
