#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "cache/sqlite_store.hpp"
#include <cstdio>
#include <unistd.h>

using namespace querycache;
using Catch::Matchers::WithinRel;

static std::string store_test_path() {
    static int counter = 0;
    return "/tmp/querycache_test_store_" + std::to_string(getpid()) + "_" +
           std::to_string(counter++) + ".db";
}

struct StoreFixture {
    std::string path = store_test_path();
    SqliteStore store{path};

    ~StoreFixture() {
        std::remove(path.c_str());
        std::remove((path + "-wal").c_str());
        std::remove((path + "-shm").c_str());
    }
};

static CacheEntry make_entry(const std::string& key, uint64_t created_at,
                             uint64_t size = 10, uint32_t ttl = 60) {
    CacheEntry e;
    e.cache_key = key;
    e.normalized_question = "question " + key;
    e.original_question = "Question " + key + "?";
    e.model_name = "test-model";
    e.sql_query = "SELECT 1";
    e.answer = "answer " + key;
    e.created_at = created_at;
    e.last_accessed_at = created_at;
    e.ttl_seconds = ttl;
    e.size_bytes = size;
    e.execution_time_ms = 100.0;
    return e;
}

// ── Basic upsert / find ──────────────────────────────────────────

TEST_CASE("SqliteStore: find on empty store", "[store]") {
    StoreFixture f;
    REQUIRE_FALSE(f.store.find("missing").has_value());
    REQUIRE(f.store.count() == 0);
    REQUIRE(f.store.backend_name() == "sqlite");
}

TEST_CASE("SqliteStore: upsert then find returns every field", "[store]") {
    StoreFixture f;
    CacheEntry e = make_entry("k1", 1000, 42, 30);
    e.result_payload = R"({"columns":["n"],"rows":[[1]]})";
    e.row_count = 1;
    e.column_manifest = R"(["n"])";
    f.store.upsert(e);

    auto got = f.store.find("k1");
    REQUIRE(got.has_value());
    REQUIRE(got->normalized_question == "question k1");
    REQUIRE(got->original_question == "Question k1?");
    REQUIRE(got->model_name == "test-model");
    REQUIRE(got->sql_query == std::optional<std::string>("SELECT 1"));
    REQUIRE(got->answer == "answer k1");
    REQUIRE(got->result_payload == e.result_payload);
    REQUIRE(got->row_count == 1);
    REQUIRE(got->column_manifest == R"(["n"])");
    REQUIRE(got->created_at == 1000);
    REQUIRE(got->access_count == 1);
    REQUIRE(got->ttl_seconds == 30);
    REQUIRE(got->size_bytes == 42);
    REQUIRE(got->valid);
}

TEST_CASE("SqliteStore: expires_at is recomputed from created_at and ttl", "[store]") {
    StoreFixture f;
    CacheEntry e = make_entry("k1", 5000, 10, 2);
    e.expires_at = 1; // ignored
    f.store.upsert(e);

    REQUIRE(f.store.find("k1")->expires_at == 7000);
}

TEST_CASE("SqliteStore: null sql and payload stay null", "[store]") {
    StoreFixture f;
    CacheEntry e = make_entry("k1", 1000);
    e.sql_query.reset();
    f.store.upsert(e);

    auto got = f.store.find("k1");
    REQUIRE_FALSE(got->sql_query.has_value());
    REQUIRE_FALSE(got->result_payload.has_value());
}

TEST_CASE("SqliteStore: upsert replaces by key", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("k1", 1000, 10));
    CacheEntry e = make_entry("k1", 2000, 25);
    e.answer = "rewritten";
    f.store.upsert(e);

    REQUIRE(f.store.count() == 1);
    REQUIRE(f.store.find("k1")->answer == "rewritten");
    REQUIRE(f.store.aggregate_size() == 25);
}

// ── Invalidation ─────────────────────────────────────────────────

TEST_CASE("SqliteStore: invalidated rows are hidden but kept", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("k1", 1000, 10));
    f.store.upsert(make_entry("k2", 1000, 20));

    REQUIRE(f.store.invalidate("k1", invalid_reason::kManual));
    REQUIRE_FALSE(f.store.invalidate("k1", invalid_reason::kManual));
    REQUIRE_FALSE(f.store.invalidate("nope", invalid_reason::kManual));

    REQUIRE_FALSE(f.store.find("k1").has_value());
    REQUIRE_FALSE(f.store.entry_size("k1").has_value());
    REQUIRE(f.store.count(true) == 1);
    REQUIRE(f.store.count(false) == 2);
    REQUIRE(f.store.aggregate_size(true) == 20);
    REQUIRE(f.store.aggregate_size(false) == 30);
}

TEST_CASE("SqliteStore: remove_invalid drops only invalid rows", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("k1", 1000));
    f.store.upsert(make_entry("k2", 1000));
    f.store.invalidate("k2", invalid_reason::kErrorSignature);

    REQUIRE(f.store.remove_invalid() == 1);
    REQUIRE(f.store.count(false) == 1);
    REQUIRE(f.store.find("k1").has_value());
}

// ── Deletion ─────────────────────────────────────────────────────

TEST_CASE("SqliteStore: remove deletes listed keys", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("k1", 1000));
    f.store.upsert(make_entry("k2", 1000));
    f.store.upsert(make_entry("k3", 1000));

    REQUIRE(f.store.remove({"k1", "k3", "missing"}) == 2);
    REQUIRE(f.store.count() == 1);
    REQUIRE(f.store.find("k2").has_value());
    REQUIRE(f.store.remove({}) == 0);
}

TEST_CASE("SqliteStore: remove handles more keys than one batch", "[store]") {
    StoreFixture f;
    std::vector<std::string> keys;
    f.store.begin();
    for (int i = 0; i < 1200; i++) {
        std::string key = "k" + std::to_string(i);
        f.store.upsert(make_entry(key, 1000));
        keys.push_back(key);
    }
    f.store.commit();

    REQUIRE(f.store.remove(keys) == 1200);
    REQUIRE(f.store.count(false) == 0);
}

TEST_CASE("SqliteStore: remove_expired uses expires_at", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("short", 1000, 10, 1)); // expires 2000
    f.store.upsert(make_entry("long", 1000, 10, 60)); // expires 61000

    REQUIRE(f.store.remove_expired(2000) == 0);
    REQUIRE(f.store.remove_expired(2001) == 1);
    REQUIRE(f.store.find("long").has_value());
}

TEST_CASE("SqliteStore: remove_all", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("k1", 1000));
    f.store.upsert(make_entry("k2", 1000));
    f.store.invalidate("k2", invalid_reason::kManual);

    REQUIRE(f.store.remove_all() == 2);
    REQUIRE(f.store.count(false) == 0);
}

// ── LRU order ────────────────────────────────────────────────────

TEST_CASE("SqliteStore: scan_by_last_access orders by access, creation, key", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("c", 3000, 1));
    f.store.upsert(make_entry("b", 2000, 2));
    f.store.upsert(make_entry("a", 2000, 3));
    f.store.upsert(make_entry("d", 1000, 4));
    f.store.touch("d", 5000);

    auto order = f.store.scan_by_last_access();
    REQUIRE(order.size() == 4);
    REQUIRE(order[0].cache_key == "a");
    REQUIRE(order[0].size_bytes == 3);
    REQUIRE(order[1].cache_key == "b");
    REQUIRE(order[2].cache_key == "c");
    REQUIRE(order[3].cache_key == "d");
}

TEST_CASE("SqliteStore: scan_by_last_access skips invalid rows", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("a", 1000));
    f.store.upsert(make_entry("b", 2000));
    f.store.invalidate("a", invalid_reason::kManual);

    auto order = f.store.scan_by_last_access();
    REQUIRE(order.size() == 1);
    REQUIRE(order[0].cache_key == "b");
}

TEST_CASE("SqliteStore: touch bumps access count and time", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("k1", 1000));
    f.store.touch("k1", 4000);
    f.store.touch("k1", 4500);

    auto got = f.store.find("k1");
    REQUIRE(got->access_count == 3);
    REQUIRE(got->last_accessed_at == 4500);
    REQUIRE(got->created_at == 1000);
}

TEST_CASE("SqliteStore: scan_answers returns valid answers", "[store]") {
    StoreFixture f;
    f.store.upsert(make_entry("k1", 1000));
    f.store.upsert(make_entry("k2", 1000));
    f.store.invalidate("k2", invalid_reason::kManual);

    auto rows = f.store.scan_answers();
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].cache_key == "k1");
    REQUIRE(rows[0].original_question == "Question k1?");
    REQUIRE(rows[0].answer == "answer k1");
}

// ── Statistics ───────────────────────────────────────────────────

TEST_CASE("SqliteStore: record_lookup accumulates per date", "[store]") {
    StoreFixture f;
    f.store.record_lookup("2024-06-15", false);
    f.store.record_lookup("2024-06-15", true);
    f.store.record_lookup("2024-06-15", true);
    f.store.record_lookup("2024-06-15", false);
    f.store.record_lookup("2024-06-16", true);

    auto day = f.store.daily("2024-06-15");
    REQUIRE(day.has_value());
    REQUIRE(day->date == "2024-06-15");
    REQUIRE(day->hits == 2);
    REQUIRE(day->misses == 2);
    REQUIRE(day->total_queries == 4);
    REQUIRE_THAT(day->hit_rate, WithinRel(0.5, 1e-9));
    REQUIRE(day->api_calls_saved == 2);

    auto next = f.store.daily("2024-06-16");
    REQUIRE(next->total_queries == 1);
    REQUIRE_THAT(next->hit_rate, WithinRel(1.0, 1e-9));
}

TEST_CASE("SqliteStore: first lookup of a day is a miss", "[store]") {
    StoreFixture f;
    f.store.record_lookup("2024-06-15", false);

    auto day = f.store.daily("2024-06-15");
    REQUIRE(day->hits == 0);
    REQUIRE(day->misses == 1);
    REQUIRE(day->hit_rate == 0.0);
    REQUIRE(day->api_calls_saved == 0);
}

TEST_CASE("SqliteStore: daily for unknown date", "[store]") {
    StoreFixture f;
    REQUIRE_FALSE(f.store.daily("1999-01-01").has_value());
}

TEST_CASE("SqliteStore: aggregates over valid entries", "[store]") {
    StoreFixture f;
    CacheEntry a = make_entry("a", 1000, 100);
    a.execution_time_ms = 200.0;
    CacheEntry b = make_entry("b", 1000, 50);
    b.execution_time_ms = 400.0;
    CacheEntry c = make_entry("c", 1000, 999);
    f.store.upsert(a);
    f.store.upsert(b);
    f.store.upsert(c);
    f.store.touch("a", 2000);
    f.store.invalidate("c", invalid_reason::kManual);

    auto stats = f.store.aggregates();
    REQUIRE(stats.total_entries == 2);
    REQUIRE(stats.total_size_bytes == 150);
    REQUIRE(stats.total_accesses == 3);
    REQUIRE_THAT(stats.avg_execution_time_ms, WithinRel(300.0, 1e-9));
}

TEST_CASE("SqliteStore: aggregates on empty store are zero", "[store]") {
    StoreFixture f;
    auto stats = f.store.aggregates();
    REQUIRE(stats.total_entries == 0);
    REQUIRE(stats.total_size_bytes == 0);
    REQUIRE(stats.avg_execution_time_ms == 0.0);
}

// ── Transactions and durability ──────────────────────────────────

TEST_CASE("SqliteStore: rolled back transaction leaves no trace", "[store]") {
    StoreFixture f;
    {
        StoreTransaction tx(f.store);
        f.store.upsert(make_entry("k1", 1000));
        f.store.record_lookup("2024-06-15", true);
    }
    REQUIRE(f.store.count(false) == 0);
    REQUIRE_FALSE(f.store.daily("2024-06-15").has_value());
}

TEST_CASE("SqliteStore: committed transaction persists", "[store]") {
    StoreFixture f;
    {
        StoreTransaction tx(f.store);
        f.store.upsert(make_entry("k1", 1000));
        tx.commit();
    }
    REQUIRE(f.store.count() == 1);
}

TEST_CASE("SqliteStore: data survives reopen", "[store]") {
    std::string path = store_test_path();
    {
        SqliteStore store(path);
        store.upsert(make_entry("k1", 1000, 77));
        store.record_lookup("2024-06-15", true);
    }
    {
        SqliteStore store(path);
        REQUIRE(store.find("k1")->size_bytes == 77);
        REQUIRE(store.daily("2024-06-15")->hits == 1);
    }
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST_CASE("SqliteStore: in-memory database", "[store]") {
    SqliteStore store(":memory:");
    store.upsert(make_entry("k1", 1000));
    REQUIRE(store.count() == 1);
}

TEST_CASE("SqliteStore: unusable path throws", "[store]") {
    REQUIRE_THROWS_AS(SqliteStore("/dev/null/querycache/cache.db"), std::runtime_error);
}
