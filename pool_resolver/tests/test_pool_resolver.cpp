#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/pool_resolver.hpp"
#include "../src/pool_filters.hpp"
#include "../src/upstream_error.hpp"
#include "../src/util.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <set>
#include <thread>
#include <vector>

namespace {

const std::string WETH = "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2";
const std::string USDC = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";

class FakeIndexedSource : public IndexedPoolSource {
public:
    std::function<std::optional<PoolRecord>(const std::string&, int64_t)> on_get_pool;
    std::function<std::optional<PoolRecord>(const std::string&, const std::string&, FeeTier, int64_t)> on_get_pair;
    std::function<std::vector<PoolRecord>(int64_t, const PoolQuery&)> on_get_pools;
    std::set<int64_t> chains{1, 137};

    std::atomic<int> pool_calls{0};
    std::atomic<int> pair_calls{0};
    std::atomic<int> list_calls{0};

    std::optional<PoolRecord> get_pool(const std::string& address, int64_t chain_id) override {
        pool_calls++;
        return on_get_pool ? on_get_pool(address, chain_id) : std::nullopt;
    }

    std::vector<PoolRecord> get_pools(int64_t chain_id, const PoolQuery& query) override {
        list_calls++;
        return on_get_pools ? on_get_pools(chain_id, query) : std::vector<PoolRecord>{};
    }

    std::optional<PoolRecord> get_pool_by_tokens(const std::string& token_a, const std::string& token_b,
                                                 FeeTier fee, int64_t chain_id) override {
        pair_calls++;
        return on_get_pair ? on_get_pair(token_a, token_b, fee, chain_id) : std::nullopt;
    }

    bool supports_chain(int64_t chain_id) const override { return chains.count(chain_id) > 0; }
};

class FakeChainSource : public ChainPoolSource {
public:
    std::function<std::optional<PoolRecord>(const std::string&, const std::string&, FeeTier, int64_t)> on_get_pair;
    std::function<std::optional<PoolRecord>(const std::string&, int64_t)> on_get_pool;
    std::set<int64_t> chains{1};
    std::atomic<int> calls{0};

    std::optional<PoolRecord> get_pool_on_chain(const std::string& token_a, const std::string& token_b,
                                                FeeTier fee, int64_t chain_id) override {
        calls++;
        return on_get_pair ? on_get_pair(token_a, token_b, fee, chain_id) : std::nullopt;
    }

    std::optional<PoolRecord> get_pool_at(const std::string& address, int64_t chain_id) override {
        calls++;
        return on_get_pool ? on_get_pool(address, chain_id) : std::nullopt;
    }

    bool supports_chain(int64_t chain_id) const override { return chains.count(chain_id) > 0; }
};

ResolverOptions fast_options() {
    ResolverOptions options;
    options.retry.max_retries = 2;
    options.retry.base_delay = std::chrono::milliseconds(1);
    options.retry.max_delay = std::chrono::milliseconds(2);
    options.retry.jitter = 0.0;
    options.rate_limit_per_second = 1000;
    options.burst_limit = 4;
    return options;
}

PoolCacheOptions cache_options() {
    PoolCacheOptions options;
    options.max_size = 100;
    options.default_ttl_ms = 60000;
    return options;
}

struct Harness {
    std::shared_ptr<PoolCache> cache = std::make_shared<PoolCache>(cache_options());
    std::shared_ptr<FakeIndexedSource> indexed = std::make_shared<FakeIndexedSource>();
    std::shared_ptr<FakeChainSource> chain = std::make_shared<FakeChainSource>();

    PoolResolver make(ResolverOptions options = fast_options(), bool with_chain = true) {
        return PoolResolver(cache, indexed, with_chain ? chain : nullptr, options);
    }
};

[[noreturn]] void fail_upstream(const std::string& message, bool retryable = true) {
    throw UpstreamException(ErrorKind::UpstreamTimeout, message, retryable);
}

} // namespace

TEST_CASE("Resolver serves the indexed service and caches the answer", "[resolver]") {
    Harness h;
    auto resolver = h.make();
    auto pool = make_pool(test_address(7), WETH, USDC);
    h.indexed->on_get_pool = [&](const std::string&, int64_t) { return pool; };

    auto first = resolver.get_pool(pool.address, 1);
    REQUIRE(first.success);
    REQUIRE(first.source == PoolSource::IndexedService);
    REQUIRE(first.data->address == pool.address);
    REQUIRE(first.error_kind == ErrorKind::None);

    auto second = resolver.get_pool(pool.address, 1);
    REQUIRE(second.success);
    REQUIRE(second.source == PoolSource::Cache);
    REQUIRE(h.indexed->pool_calls == 1);
    REQUIRE(h.chain->calls == 0);
}

TEST_CASE("Resolver falls back to the chain after retries are exhausted", "[resolver]") {
    Harness h;
    auto resolver = h.make();
    auto pool = make_pool(test_address(8), WETH, USDC, FeeTier::Low);

    h.indexed->on_get_pair = [](const std::string&, const std::string&, FeeTier, int64_t)
        -> std::optional<PoolRecord> { fail_upstream("subgraph timed out"); };
    h.chain->on_get_pair = [&](const std::string&, const std::string&, FeeTier, int64_t) { return pool; };

    auto result = resolver.get_pool_by_tokens(WETH, USDC, FeeTier::Low, 1);
    REQUIRE(result.success);
    REQUIRE(result.source == PoolSource::Chain);
    REQUIRE(h.indexed->pair_calls == 3);
    REQUIRE(h.chain->calls == 1);

    auto again = resolver.get_pool_by_tokens(USDC, WETH, FeeTier::Low, 1);
    REQUIRE(again.success);
    REQUIRE(again.source == PoolSource::Cache);
    REQUIRE(h.indexed->pair_calls == 3);
}

TEST_CASE("Resolver recovers when a retry succeeds", "[resolver]") {
    Harness h;
    auto resolver = h.make();
    auto pool = make_pool(test_address(9), WETH, USDC);

    h.indexed->on_get_pool = [&](const std::string&, int64_t) -> std::optional<PoolRecord> {
        if (h.indexed->pool_calls < 3) fail_upstream("flaky");
        return pool;
    };

    auto result = resolver.get_pool(pool.address, 1);
    REQUIRE(result.success);
    REQUIRE(result.source == PoolSource::IndexedService);
    REQUIRE(h.indexed->pool_calls == 3);
    REQUIRE(h.chain->calls == 0);
}

TEST_CASE("Non-retryable indexed failures go straight to the chain", "[resolver]") {
    Harness h;
    auto resolver = h.make();
    auto pool = make_pool(test_address(10), WETH, USDC);

    h.indexed->on_get_pool = [](const std::string&, int64_t) -> std::optional<PoolRecord> {
        fail_upstream("schema mismatch", false);
    };
    h.chain->on_get_pool = [&](const std::string&, int64_t) { return pool; };

    auto result = resolver.get_pool(pool.address, 1);
    REQUIRE(result.success);
    REQUIRE(result.source == PoolSource::Chain);
    REQUIRE(h.indexed->pool_calls == 1);
}

TEST_CASE("Resolver returns a synthetic placeholder when every source fails", "[resolver]") {
    Harness h;
    auto resolver = h.make();

    h.indexed->on_get_pair = [](const std::string&, const std::string&, FeeTier, int64_t)
        -> std::optional<PoolRecord> { fail_upstream("subgraph down"); };

    // No chain reader for Polygon in this harness
    auto result = resolver.get_pool_by_tokens(WETH, USDC, FeeTier::Medium, 137);
    REQUIRE(result.success);
    REQUIRE(result.source == PoolSource::Synthetic);
    REQUIRE(result.data->synthetic);
    REQUIRE(result.data->chain_id == 137);
    REQUIRE(result.data->token_a.address == util::to_lower(USDC));
    REQUIRE(result.data->total_value_locked_usd == "0");
    REQUIRE(result.error.has_value());
    REQUIRE(result.error_kind == ErrorKind::Unavailable);
    REQUIRE(h.chain->calls == 0);

    REQUIRE_FALSE(h.cache->has(LookupKey::for_pair(WETH, USDC, FeeTier::Medium, 137)));

    // Same key, same placeholder address
    auto again = resolver.get_pool_by_tokens(USDC, WETH, FeeTier::Medium, 137);
    REQUIRE(again.source == PoolSource::Synthetic);
    REQUIRE(again.data->address == result.data->address);
    REQUIRE(util::is_valid_evm_address(again.data->address));
}

TEST_CASE("Synthetic fallback can be disabled", "[resolver]") {
    Harness h;
    auto options = fast_options();
    options.synthetic_fallback = false;
    auto resolver = h.make(options);

    h.indexed->on_get_pool = [](const std::string&, int64_t) -> std::optional<PoolRecord> {
        fail_upstream("subgraph down");
    };
    h.chain->on_get_pool = [](const std::string&, int64_t) -> std::optional<PoolRecord> {
        throw UpstreamException(ErrorKind::UpstreamError, "rpc down");
    };

    auto result = resolver.get_pool(test_address(11), 1);
    REQUIRE_FALSE(result.success);
    REQUIRE_FALSE(result.data.has_value());
    REQUIRE(result.error_kind == ErrorKind::Unavailable);
    REQUIRE_THAT(*result.error, Catch::Matchers::ContainsSubstring("subgraph down") && Catch::Matchers::ContainsSubstring("rpc down"));
}

TEST_CASE("Pools every source reports absent are NotFound", "[resolver]") {
    Harness h;

    SECTION("Indexed and chain both say absent") {
        auto resolver = h.make();
        auto result = resolver.get_pool(test_address(12), 1);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == ErrorKind::NotFound);
        REQUIRE(h.chain->calls == 1);
    }

    SECTION("Indexed says absent and no chain reader is configured") {
        auto resolver = h.make(fast_options(), false);
        auto result = resolver.get_pool_by_tokens(WETH, USDC, FeeTier::High, 1);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == ErrorKind::NotFound);
    }

    SECTION("NotFound is not cached") {
        auto resolver = h.make();
        resolver.get_pool(test_address(12), 1);
        resolver.get_pool(test_address(12), 1);
        REQUIRE(h.indexed->pool_calls == 2);
    }
}

TEST_CASE("Malformed requests are rejected without upstream calls", "[resolver]") {
    Harness h;
    auto resolver = h.make();

    auto bad_address = resolver.get_pool("0x1234", 1);
    REQUIRE_FALSE(bad_address.success);
    REQUIRE(bad_address.error_kind == ErrorKind::InvalidRequest);

    auto same_token = resolver.get_pool_by_tokens(WETH, util::to_lower(WETH), FeeTier::Medium, 1);
    REQUIRE(same_token.error_kind == ErrorKind::InvalidRequest);

    auto bad_chain = resolver.get_pool(test_address(1), 0);
    REQUIRE(bad_chain.error_kind == ErrorKind::InvalidRequest);

    auto empty_search = resolver.search_pools("   ", 1);
    REQUIRE(empty_search.error_kind == ErrorKind::InvalidRequest);

    REQUIRE(h.indexed->pool_calls == 0);
    REQUIRE(h.indexed->pair_calls == 0);
    REQUIRE(h.indexed->list_calls == 0);
}

TEST_CASE("Token order does not change the resolved pool", "[resolver]") {
    Harness h;
    auto resolver = h.make();

    std::vector<std::pair<std::string, std::string>> seen;
    h.indexed->on_get_pair = [&](const std::string& a, const std::string& b, FeeTier fee, int64_t) {
        seen.emplace_back(a, b);
        return std::optional<PoolRecord>(make_pool(test_address(20), a, b, fee));
    };

    auto forward = resolver.get_pool_by_tokens(WETH, USDC, FeeTier::Medium, 1);
    auto reverse = resolver.get_pool_by_tokens(USDC, WETH, FeeTier::Medium, 1);

    REQUIRE(forward.success);
    REQUIRE(reverse.success);
    REQUIRE(reverse.source == PoolSource::Cache);
    REQUIRE(forward.data->address == reverse.data->address);
    REQUIRE(h.indexed->pair_calls == 1);

    // The upstream query already carries the canonical order
    REQUIRE(seen.front().first == util::to_lower(USDC));
    REQUIRE(seen.front().second == util::to_lower(WETH));

    // Reachable by address too
    auto by_address = resolver.get_pool(test_address(20), 1);
    REQUIRE(by_address.source == PoolSource::Cache);
}

TEST_CASE("Concurrent lookups of one key share a single upstream fetch", "[resolver]") {
    Harness h;
    auto resolver = h.make();
    auto pool = make_pool(test_address(30), WETH, USDC);

    h.indexed->on_get_pool = [&](const std::string&, int64_t) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return std::optional<PoolRecord>(pool);
    };

    const int caller_count = 8;
    std::vector<FetchResult<PoolRecord>> results(caller_count);
    std::vector<std::thread> callers;
    for (int i = 0; i < caller_count; ++i) {
        callers.emplace_back([&, i]() { results[i] = resolver.get_pool(pool.address, 1); });
    }
    for (auto& t : callers) {
        t.join();
    }

    REQUIRE(h.indexed->pool_calls == 1);
    for (const auto& result : results) {
        REQUIRE(result.success);
        REQUIRE(result.data->address == pool.address);
    }
}

TEST_CASE("Batch lookups are independent", "[resolver]") {
    Harness h;
    auto resolver = h.make();
    auto pool = make_pool(test_address(40), WETH, USDC);
    h.indexed->on_get_pool = [&](const std::string& address, int64_t) -> std::optional<PoolRecord> {
        if (address == pool.address) return pool;
        return std::nullopt;
    };

    SECTION("One good and one malformed request") {
        std::vector<PoolRequest> requests = {
            PoolRequest::by_address(pool.address, 1),
            PoolRequest::by_address("not-an-address", 1)
        };

        auto result = resolver.batch_get_pools(requests);
        REQUIRE(result.success);
        REQUIRE(result.data->size() == 1);
        REQUIRE(result.data->front().address == pool.address);
        REQUIRE(result.error.has_value());
        REQUIRE_THAT(*result.error, Catch::Matchers::StartsWith("[1]"));
        REQUIRE(result.error_kind == ErrorKind::InvalidRequest);
    }

    SECTION("All requests failing is a failure") {
        std::vector<PoolRequest> requests = {
            PoolRequest::by_address(test_address(41), 1),
            PoolRequest::by_address(test_address(42), 1)
        };

        auto result = resolver.batch_get_pools(requests);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.data->empty());
        REQUIRE(result.error_kind == ErrorKind::NotFound);
    }

    SECTION("An empty batch succeeds with no pools") {
        auto result = resolver.batch_get_pools({});
        REQUIRE(result.success);
        REQUIRE(result.data->empty());
        REQUIRE_FALSE(result.error.has_value());
    }

    SECTION("Batch source reports the most degraded answer") {
        resolver.get_pool(pool.address, 1);
        h.indexed->on_get_pair = [](const std::string&, const std::string&, FeeTier, int64_t)
            -> std::optional<PoolRecord> { fail_upstream("down"); };
        h.chain->chains.clear();

        std::vector<PoolRequest> requests = {
            PoolRequest::by_address(pool.address, 1),
            PoolRequest::by_tokens(WETH, USDC, FeeTier::High, 1)
        };

        auto result = resolver.batch_get_pools(requests);
        REQUIRE(result.success);
        REQUIRE(result.data->size() == 2);
        REQUIRE(result.source == PoolSource::Synthetic);
    }
}

TEST_CASE("Pool lists are filtered and cached", "[resolver]") {
    Harness h;
    auto resolver = h.make();

    h.indexed->on_get_pools = [](int64_t chain_id, const PoolQuery&) {
        return std::vector<PoolRecord>{
            make_pool(test_address(50), test_address(1), test_address(2), FeeTier::Medium, chain_id, "90000"),
            make_pool(test_address(51), test_address(1), test_address(3), FeeTier::Low, chain_id, "500"),
            make_pool(test_address(52), test_address(2), test_address(3), FeeTier::High, chain_id, "20000")
        };
    };

    SECTION("Top pools drop anything under the TVL floor") {
        auto result = resolver.get_top_pools(1, 10);
        REQUIRE(result.success);
        REQUIRE(result.data->size() == 2);
        REQUIRE(h.cache->has(LookupKey::for_address(test_address(50), 1)));
        REQUIRE_FALSE(h.cache->has(LookupKey::for_address(test_address(51), 1)));
    }

    SECTION("Fee tier filters apply after the fetch") {
        PoolQuery query;
        query.fee_tiers = {FeeTier::High};
        auto result = resolver.get_pools(1, query);
        REQUIRE(result.data->size() == 1);
        REQUIRE(result.data->front().address == test_address(52));
    }

    SECTION("Results come back in the requested order and page size") {
        PoolQuery query;
        query.order_by = PoolOrderBy::TotalValueLockedUsd;
        query.order_direction = OrderDirection::Asc;
        auto ascending = resolver.get_pools(1, query);
        REQUIRE(ascending.data->size() == 3);
        REQUIRE(ascending.data->at(0).address == test_address(51));
        REQUIRE(ascending.data->at(1).address == test_address(52));
        REQUIRE(ascending.data->at(2).address == test_address(50));

        query.order_direction = OrderDirection::Desc;
        query.first = 1;
        query.skip = 1;
        auto top = resolver.get_pools(1, query);
        REQUIRE(top.data->size() == 1);
        REQUIRE(top.data->front().address == test_address(50));
    }

    SECTION("Invalid token filters are rejected") {
        PoolQuery query;
        query.tokens = {"0xnope"};
        auto result = resolver.get_pools(1, query);
        REQUIRE(result.error_kind == ErrorKind::InvalidRequest);
        REQUIRE(h.indexed->list_calls == 0);
    }

    SECTION("Unsupported chains are unavailable") {
        auto result = resolver.get_pools(56, PoolQuery{});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == ErrorKind::Unavailable);
    }

    SECTION("List failures are unavailable and never synthetic") {
        h.indexed->on_get_pools = [](int64_t, const PoolQuery&) -> std::vector<PoolRecord> {
            fail_upstream("down");
        };
        auto result = resolver.get_pools(1, PoolQuery{});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == ErrorKind::Unavailable);
        REQUIRE(h.indexed->list_calls == 3);
    }
}

TEST_CASE("Search matches symbols or token addresses", "[resolver]") {
    Harness h;
    auto resolver = h.make();

    h.indexed->on_get_pools = [](int64_t chain_id, const PoolQuery& query) {
        auto weth_usdc = make_pool(test_address(60), WETH, USDC, FeeTier::Medium, chain_id, "9000");
        weth_usdc.token_a.symbol = "WETH";
        weth_usdc.token_b.symbol = "USDC";
        auto wbtc_dai = make_pool(test_address(61), test_address(5), test_address(6), FeeTier::Medium, chain_id, "8000");
        wbtc_dai.token_a.symbol = "WBTC";
        wbtc_dai.token_b.symbol = "DAI";

        std::vector<PoolRecord> pools{weth_usdc, wbtc_dai};
        if (!query.tokens.empty()) {
            return match_token(pools, query.tokens.front());
        }
        return pools;
    };

    SECTION("Symbol search is case-insensitive") {
        auto result = resolver.search_pools("weth", 1);
        REQUIRE(result.success);
        REQUIRE(result.data->size() == 1);
        REQUIRE(result.data->front().address == test_address(60));
    }

    SECTION("Address search returns pools holding the token") {
        auto result = resolver.search_pools(test_address(5), 1);
        REQUIRE(result.data->size() == 1);
        REQUIRE(result.data->front().address == test_address(61));
    }

    SECTION("Limit caps the matches") {
        SearchOptions options;
        options.limit = 1;
        auto result = resolver.search_pools("W", 1, options);
        REQUIRE(result.data->size() == 1);
    }
}

TEST_CASE("Shutdown cancels pending waits", "[resolver]") {
    Harness h;
    auto options = fast_options();
    options.retry.base_delay = std::chrono::seconds(30);
    options.retry.max_delay = std::chrono::seconds(30);
    options.synthetic_fallback = false;
    auto resolver = h.make(options);

    h.indexed->on_get_pool = [](const std::string&, int64_t) -> std::optional<PoolRecord> {
        fail_upstream("slow");
    };

    FetchResult<PoolRecord> result;
    std::thread caller([&]() { result = resolver.get_pool(test_address(70), 1); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto started = std::chrono::steady_clock::now();
    resolver.shutdown();
    caller.join();

    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_kind == ErrorKind::Unavailable);
    REQUIRE(h.chain->calls == 0);
}
