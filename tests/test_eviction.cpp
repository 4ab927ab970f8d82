#include <catch2/catch_test_macros.hpp>
#include "cache/eviction.hpp"

using namespace querycache;

// ── needs_eviction / eviction_target ─────────────────────────────

TEST_CASE("needs_eviction: only when the write would exceed the cap", "[eviction]") {
    REQUIRE_FALSE(needs_eviction(50, 50, 100));
    REQUIRE(needs_eviction(51, 50, 100));
    REQUIRE_FALSE(needs_eviction(0, 0, 0));
}

TEST_CASE("eviction_target: ratio of cap, clamped", "[eviction]") {
    REQUIRE(eviction_target(1000, 0.9) == 900);
    REQUIRE(eviction_target(1000, 1.0) == 1000);
    REQUIRE(eviction_target(1000, 1.5) == 1000);
    REQUIRE(eviction_target(1000, 0.0) == 0);
    REQUIRE(eviction_target(999, 0.5) == 499);
}

// ── plan_eviction ────────────────────────────────────────────────

static std::vector<EvictionCandidate> lru(std::initializer_list<uint64_t> sizes) {
    std::vector<EvictionCandidate> out;
    char name = 'a';
    for (uint64_t s : sizes) {
        out.push_back({std::string(1, name++), s});
    }
    return out;
}

TEST_CASE("plan_eviction: nothing to do under the cap", "[eviction]") {
    auto plan = plan_eviction(lru({40, 40}), 80, 20, 100, 0.9);
    REQUIRE(plan.keys.empty());
    REQUIRE(plan.freed_bytes == 0);
    REQUIRE(plan.reaches_target);
}

TEST_CASE("plan_eviction: evicts oldest first down to the target", "[eviction]") {
    // cap 100, target 90: 100 + 20 must drop to <= 90, so at least 30 bytes go.
    auto plan = plan_eviction(lru({20, 20, 20, 20, 20}), 100, 20, 100, 0.9);
    REQUIRE(plan.keys == std::vector<std::string>{"a", "b"});
    REQUIRE(plan.freed_bytes == 40);
    REQUIRE(plan.reaches_target);
}

TEST_CASE("plan_eviction: stops as soon as the target is reached", "[eviction]") {
    auto plan = plan_eviction(lru({50, 10, 10}), 70, 40, 100, 0.9);
    REQUIRE(plan.keys == std::vector<std::string>{"a"});
    REQUIRE(plan.freed_bytes == 50);
}

TEST_CASE("plan_eviction: protected key is skipped", "[eviction]") {
    auto plan = plan_eviction(lru({30, 30, 30}), 90, 30, 100, 0.9, "a");
    REQUIRE(plan.keys == std::vector<std::string>{"b"});
    REQUIRE(plan.freed_bytes == 30);
}

TEST_CASE("plan_eviction: reports when candidates run out", "[eviction]") {
    auto plan = plan_eviction(lru({10}), 10, 95, 100, 0.9);
    REQUIRE(plan.keys == std::vector<std::string>{"a"});
    REQUIRE_FALSE(plan.reaches_target);
}

TEST_CASE("plan_eviction: ratio 1.0 evicts only to the cap", "[eviction]") {
    auto plan = plan_eviction(lru({10, 10, 10}), 30, 80, 100, 1.0);
    REQUIRE(plan.keys == std::vector<std::string>{"a"});
}
