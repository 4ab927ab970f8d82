#include <catch2/catch_test_macros.hpp>
#include "cache/question_key.hpp"
#include <cctype>

using namespace querycache;

static const std::string kModel = "meta-llama/llama-3.1-8b-instruct:free";

// ── normalize_question ───────────────────────────────────────────

TEST_CASE("normalize_question: lowercases and trims", "[key]") {
    REQUIRE(normalize_question("  Show me ALL customers  ") == "show me all customers");
}

TEST_CASE("normalize_question: collapses internal whitespace", "[key]") {
    REQUIRE(normalize_question("top\t5   products\nby revenue") == "top 5 products by revenue");
}

TEST_CASE("normalize_question: strips trailing punctuation", "[key]") {
    REQUIRE(normalize_question("How many orders?") == "how many orders");
    REQUIRE(normalize_question("List customers.") == "list customers");
    REQUIRE(normalize_question("Show sales!?!") == "show sales");
    REQUIRE(normalize_question("customers ?") == "customers");
}

TEST_CASE("normalize_question: inner punctuation kept", "[key]") {
    REQUIRE(normalize_question("Sales in Q3? By region.") == "sales in q3? by region");
}

TEST_CASE("normalize_question: blank and punctuation-only input", "[key]") {
    REQUIRE(normalize_question("").empty());
    REQUIRE(normalize_question("   ").empty());
    REQUIRE(normalize_question("?!.").empty());
}

TEST_CASE("normalize_question: idempotent", "[key]") {
    std::string once = normalize_question("  What ARE the   top customers?? ");
    REQUIRE(normalize_question(once) == once);
}

// ── cache_key ────────────────────────────────────────────────────

TEST_CASE("cache_key: 64 lowercase hex characters", "[key]") {
    std::string key = cache_key("How many customers?", kModel);
    REQUIRE(key.size() == 64);
    for (char c : key) {
        REQUIRE((std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f')));
    }
}

TEST_CASE("cache_key: case, whitespace and trailing punctuation collide", "[key]") {
    std::string a = cache_key("How many customers?", kModel);
    REQUIRE(cache_key("how many customers", kModel) == a);
    REQUIRE(cache_key("  HOW   many customers  ?", kModel) == a);
    REQUIRE(cache_key("How many customers.", kModel) == a);
}

TEST_CASE("cache_key: different question gives different key", "[key]") {
    REQUIRE(cache_key("How many customers?", kModel) !=
            cache_key("How many orders?", kModel));
}

TEST_CASE("cache_key: model is part of the key", "[key]") {
    REQUIRE(cache_key("How many customers?", kModel) !=
            cache_key("How many customers?", "openai/gpt-4-turbo"));
}

TEST_CASE("cache_key: deterministic", "[key]") {
    REQUIRE(cache_key("Revenue by month", kModel) == cache_key("Revenue by month", kModel));
}

TEST_CASE("cache_key_normalized: matches cache_key on normalized input", "[key]") {
    std::string q = "  Revenue By Month?";
    REQUIRE(cache_key_normalized(normalize_question(q), kModel) == cache_key(q, kModel));
}

TEST_CASE("cache_key_normalized: separator keeps question and model apart", "[key]") {
    REQUIRE(cache_key_normalized("ab", "c") != cache_key_normalized("a", "bc"));
}

// ── short_key ────────────────────────────────────────────────────

TEST_CASE("short_key: truncates long keys", "[key]") {
    std::string key = cache_key("x", kModel);
    REQUIRE(short_key(key) == key.substr(0, 16) + "...");
}

TEST_CASE("short_key: short input unchanged", "[key]") {
    REQUIRE(short_key("abc") == "abc");
}
