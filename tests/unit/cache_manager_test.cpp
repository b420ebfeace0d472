#include <catch2/catch_test_macros.hpp>

#include "cache_manager.hpp"
#include "KeyManager.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace data_assistance;

TEST_CASE("LRU cache eviction", "[cache]") {
    LRUCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    REQUIRE(cache.get("a") == 1);   // a is now most recent

    cache.set("c", 3);              // evicts b
    REQUIRE_FALSE(cache.get("b").has_value());
    REQUIRE(cache.get("a") == 1);
    REQUIRE(cache.get("c") == 3);
    REQUIRE(cache.size() == 2);

    cache.set("a", 10);
    REQUIRE(cache.get("a") == 10);
    REQUIRE(cache.size() == 2);

    cache.clear();
    REQUIRE(cache.size() == 0);
}

TEST_CASE("LRU cache expiry", "[cache]") {
    LRUCache<std::string, int> cache(4, std::chrono::seconds(0));
    cache.set("a", 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    REQUIRE_FALSE(cache.get("a").has_value());
    REQUIRE(cache.size() == 0);
}

TEST_CASE("Zero capacity cache stores nothing", "[cache]") {
    LRUCache<std::string, int> cache(0);
    cache.set("a", 1);
    REQUIRE_FALSE(cache.get("a").has_value());
}

TEST_CASE("Embedding cache", "[cache]") {
    CacheManager manager(8);
    REQUIRE_FALSE(manager.get_embedding("text").has_value());

    manager.set_embedding("text", {0.5f, 0.5f});
    auto hit = manager.get_embedding("text");
    REQUIRE(hit.has_value());
    REQUIRE(*hit == std::vector<float>{0.5f, 0.5f});
    REQUIRE(manager.embedding_count() == 1);

    manager.clear_all();
    REQUIRE(manager.embedding_count() == 0);
}

TEST_CASE("Key rotation", "[cache][keys]") {
    SECTION("Empty pool") {
        KeyManager keys(std::vector<std::string>{});
        REQUIRE(keys.get_active_key_count() == 0);
        REQUIRE(keys.get_current_key().empty());
        keys.report_rate_limit();
    }

    SECTION("Rate limits rotate and eventually retire a key") {
        KeyManager keys(std::vector<std::string>{"k1", "", "k2"});
        REQUIRE(keys.get_active_key_count() == 2);
        REQUIRE(keys.get_current_key() == "k1");

        keys.report_rate_limit();
        REQUIRE(keys.get_current_key() == "k2");
        keys.report_rate_limit();
        REQUIRE(keys.get_current_key() == "k1");

        // third failure retires k1
        keys.report_rate_limit();
        keys.report_rate_limit();
        keys.report_rate_limit();
        REQUIRE(keys.get_active_key_count() == 1);
        REQUIRE(keys.get_current_key() == "k2");
    }

    SECTION("Failures after a retirement land on the key in use") {
        KeyManager keys(std::vector<std::string>{"a", "b", "c"});
        for (int i = 0; i < 7; ++i) keys.report_rate_limit();
        REQUIRE(keys.get_active_key_count() == 2);
        REQUIRE(keys.get_current_key() == "b");

        keys.report_rate_limit();
        REQUIRE(keys.get_active_key_count() == 1);
        REQUIRE(keys.get_current_key() == "c");

        keys.report_rate_limit();
        REQUIRE(keys.get_active_key_count() == 0);
        REQUIRE(keys.get_current_key().empty());
        keys.report_rate_limit();
        REQUIRE(keys.get_active_key_count() == 0);
    }
}
