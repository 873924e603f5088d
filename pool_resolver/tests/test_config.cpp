#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include "../src/pool_cache.hpp"
#include "../src/pool_resolver.hpp"
#include <cstdlib>
#include <stdexcept>

TEST_CASE("Endpoint maps parse from chain=url lists", "[config]") {
    auto endpoints = Config::parse_endpoint_map("1=https://a.example/graph, 137 = https://b.example/graph");
    REQUIRE(endpoints.size() == 2);
    REQUIRE(endpoints.at(1) == "https://a.example/graph");
    REQUIRE(endpoints.at(137) == "https://b.example/graph");

    // URLs may carry '=' in their query string
    auto with_query = Config::parse_endpoint_map("8453=https://rpc.example/?key=abc");
    REQUIRE(with_query.at(8453) == "https://rpc.example/?key=abc");

    REQUIRE_THROWS_AS(Config::parse_endpoint_map("https://no-chain.example"), std::runtime_error);
    REQUIRE_THROWS_AS(Config::parse_endpoint_map("mainnet=https://a.example"), std::runtime_error);
    REQUIRE_THROWS_AS(Config::parse_endpoint_map("0=https://a.example"), std::runtime_error);
    REQUIRE_THROWS_AS(Config::parse_endpoint_map("1="), std::runtime_error);
}

TEST_CASE("Defaults cover the supported chains", "[config]") {
    Config config;
    for (int64_t chain : {1, 10, 56, 137, 8453, 42161}) {
        REQUIRE(config.subgraph_urls.count(chain) == 1);
        REQUIRE(config.rpc_urls.count(chain) == 1);
    }
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Validation rejects unusable settings", "[config]") {
    Config config;

    SECTION("Cache size") { config.max_cache_size = 0; }
    SECTION("TTL") { config.default_ttl_ms = 0; }
    SECTION("Retry delays") { config.retry_max_delay_ms = config.retry_base_delay_ms - 1; }
    SECTION("Rate limit") { config.rate_limit_per_second = 0; }
    SECTION("Backend") { config.persistence_backend = "postgres"; }
    SECTION("Endpoints") { config.subgraph_urls.clear(); }
    SECTION("Port") { config.http_port = 70000; }

    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("Configuration reads the environment", "[config]") {
    setenv("MAX_CACHE_SIZE", "42", 1);
    setenv("SUBGRAPH_URLS", "1=http://localhost:8000/subgraphs/uniswap", 1);
    setenv("SYNTHETIC_FALLBACK", "false", 1);
    setenv("PERSISTENCE_BACKEND", "Redis", 1);

    auto config = Config::from_env();

    unsetenv("MAX_CACHE_SIZE");
    unsetenv("SUBGRAPH_URLS");
    unsetenv("SYNTHETIC_FALLBACK");
    unsetenv("PERSISTENCE_BACKEND");

    REQUIRE(config.max_cache_size == 42);
    REQUIRE(config.subgraph_urls.size() == 1);
    REQUIRE_FALSE(config.synthetic_fallback);
    REQUIRE(config.persistence_backend == "redis");
    REQUIRE(config.rpc_urls.size() == Config::default_rpc_urls().size());

    auto cache_options = PoolCacheOptions::from_config(config);
    REQUIRE(cache_options.max_size == 42);

    auto resolver_options = ResolverOptions::from_config(config);
    REQUIRE_FALSE(resolver_options.synthetic_fallback);
    REQUIRE(resolver_options.retry.max_retries == config.max_retries);
}

TEST_CASE("Malformed integers in the environment are reported", "[config]") {
    setenv("HTTP_PORT", "eighty", 1);
    REQUIRE_THROWS_AS(Config::from_env(), std::runtime_error);
    unsetenv("HTTP_PORT");
}
