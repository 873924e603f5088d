#include <catch2/catch_test_macros.hpp>
#include "../src/lru_store.hpp"
#include <string>

TEST_CASE("LRU store basics", "[lru]") {
    LruStore<std::string, int> store(3);

    SECTION("Set then get returns the value") {
        store.set("a", 1);
        REQUIRE(store.has("a"));
        REQUIRE(store.get("a") != nullptr);
        REQUIRE(*store.get("a") == 1);
        REQUIRE(store.get("missing") == nullptr);
    }

    SECTION("Overwrite keeps a single entry") {
        store.set("a", 1);
        auto evicted = store.set("a", 2);
        REQUIRE_FALSE(evicted.has_value());
        REQUIRE(store.size() == 1);
        REQUIRE(*store.get("a") == 2);
    }

    SECTION("Erase and clear") {
        store.set("a", 1);
        store.set("b", 2);
        REQUIRE(store.erase("a"));
        REQUIRE_FALSE(store.erase("a"));
        REQUIRE(store.size() == 1);
        store.clear();
        REQUIRE(store.empty());
    }

    SECTION("Zero capacity is rejected") {
        REQUIRE_THROWS_AS((LruStore<std::string, int>(0)), std::invalid_argument);
    }
}

TEST_CASE("LRU eviction order", "[lru]") {
    LruStore<std::string, int> store(3);
    store.set("a", 1);
    store.set("b", 2);
    store.set("c", 3);

    SECTION("Inserting into a full store evicts the least recently used key") {
        auto evicted = store.set("d", 4);
        REQUIRE(evicted.has_value());
        REQUIRE(evicted->first == "a");
        REQUIRE(evicted->second == 1);
        REQUIRE_FALSE(store.has("a"));
        REQUIRE(store.size() == 3);
    }

    SECTION("get promotes a key out of the eviction slot") {
        store.get("a");
        auto evicted = store.set("d", 4);
        REQUIRE(evicted->first == "b");
        REQUIRE(store.has("a"));
    }

    SECTION("peek does not promote") {
        REQUIRE(*store.peek("a") == 1);
        auto evicted = store.set("d", 4);
        REQUIRE(evicted->first == "a");
    }

    SECTION("Iteration runs least recent first") {
        store.get("a");
        std::string order;
        for (const auto& entry : store) {
            order += entry.first;
        }
        REQUIRE(order == "bca");
    }

    SECTION("erase_if removes matching entries") {
        auto removed = store.erase_if([](const std::string&, int value) { return value % 2 == 1; });
        REQUIRE(removed.size() == 2);
        REQUIRE(store.size() == 1);
        REQUIRE(store.has("b"));
    }
}
