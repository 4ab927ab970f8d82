#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace querycache {

nlohmann::json Config::defaults_json() {
    return {
        {"model", "meta-llama/llama-3.1-8b-instruct:free"},
        {"cache", {
            {"enabled", true},
            {"path", "~/.querycache/query_cache.db"},
            {"default_ttl", 86400},
            {"max_size_mb", 500},
            {"max_result_size_mb", 10},
            {"eviction_target", 0.9},
            {"error_markers", nlohmann::json::array()}
        }},
        {"warmer", {
            {"max_questions", 0}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool parse_bool_env(const char* v, bool fallback) {
    std::string s = to_lower(trim(v));
    if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
    if (s == "false" || s == "0" || s == "no" || s == "off") return false;
    return fallback;
}

static bool parse_uint_env(const char* v, uint32_t& out) {
    if (*v == '-') return false;
    try {
        size_t pos = 0;
        unsigned long n = std::stoul(v, &pos);
        if (pos != std::string(v).size()) return false;
        if (n > UINT32_MAX) return false;
        out = static_cast<uint32_t>(n);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Non-negative integer field that fits in 32 bits.
static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return;
    int64_t v = obj[key].get<int64_t>();
    if (v >= 0 && v <= static_cast<int64_t>(UINT32_MAX)) out = static_cast<uint32_t>(v);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("path") && c["path"].is_string())
            cfg.cache.path = c["path"].get<std::string>();
        read_uint(c, "default_ttl", cfg.cache.default_ttl);
        read_uint(c, "max_size_mb", cfg.cache.max_size_mb);
        read_uint(c, "max_result_size_mb", cfg.cache.max_result_size_mb);
        if (c.contains("eviction_target") && c["eviction_target"].is_number()) {
            double t = c["eviction_target"].get<double>();
            if (t > 0.0 && t <= 1.0) cfg.cache.eviction_target = t;
        }
        if (c.contains("error_markers") && c["error_markers"].is_array()) {
            for (const auto& m : c["error_markers"]) {
                if (m.is_string() && !m.get<std::string>().empty())
                    cfg.cache.error_markers.push_back(m.get<std::string>());
            }
        }
    }

    if (j.contains("warmer") && j["warmer"].is_object()) {
        auto& w = j["warmer"];
        read_uint(w, "max_questions", cfg.warmer.max_questions);
    }

    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("CACHE_ENABLED"))
        cache.enabled = parse_bool_env(v, cache.enabled);
    if (const char* v = std::getenv("CACHE_DB_PATH"))
        cache.path = v;

    uint32_t n = 0;
    if (const char* v = std::getenv("CACHE_TTL_SECONDS")) {
        if (parse_uint_env(v, n)) cache.default_ttl = n;
        else std::cerr << "[config] Ignoring invalid CACHE_TTL_SECONDS: " << v << "\n";
    }
    if (const char* v = std::getenv("CACHE_MAX_SIZE_MB")) {
        if (parse_uint_env(v, n)) cache.max_size_mb = n;
        else std::cerr << "[config] Ignoring invalid CACHE_MAX_SIZE_MB: " << v << "\n";
    }
    if (const char* v = std::getenv("CACHE_MAX_RESULT_SIZE_MB")) {
        if (parse_uint_env(v, n)) cache.max_result_size_mb = n;
        else std::cerr << "[config] Ignoring invalid CACHE_MAX_RESULT_SIZE_MB: " << v << "\n";
    }
}

Config Config::load() {
    std::string config_path = expand_home("~/.querycache/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

Config Config::load_file(const std::string& path) {
    nlohmann::json j = defaults_json();

    std::ifstream file(expand_home(path));
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << path
                      << ", using defaults: " << e.what() << "\n";
        }
    } else {
        std::cerr << "[config] Config file not found, using defaults: " << path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

} // namespace querycache
