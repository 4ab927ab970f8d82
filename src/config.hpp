#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace querycache {

struct CacheConfig {
    bool enabled = true;
    std::string path = "~/.querycache/query_cache.db";
    uint32_t default_ttl = 86400;        // 24 hours
    uint32_t max_size_mb = 500;          // aggregate cap over valid entries
    uint32_t max_result_size_mb = 10;    // per-entry cap
    double eviction_target = 0.9;        // evict down to this fraction of the cap
    std::vector<std::string> error_markers; // extra failure signatures

    uint64_t max_size_bytes() const { return uint64_t{max_size_mb} * 1024 * 1024; }
    uint64_t max_entry_size_bytes() const { return uint64_t{max_result_size_mb} * 1024 * 1024; }
};

struct WarmerConfig {
    uint32_t max_questions = 0; // 0 = all
};

struct Config {
    std::string model = "meta-llama/llama-3.1-8b-instruct:free";

    CacheConfig cache;
    WarmerConfig warmer;

    // Load from ~/.querycache/config.json + env vars
    static Config load();

    // Load an explicit config file (not created if missing) + env vars
    static Config load_file(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Populate a Config from already-parsed JSON (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // CACHE_* environment variables override file values
    void apply_env_overrides();
};

} // namespace querycache
