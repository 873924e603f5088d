#pragma once

#include "config.hpp"
#include "lookup_key.hpp"
#include "pool_cache.hpp"
#include "pool_source.hpp"
#include "rate_limiter.hpp"
#include "retry_executor.hpp"
#include "stop_signal.hpp"
#include "types.hpp"
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct ResolverOptions {
    RetryPolicy retry;
    int rate_limit_per_second = 10;
    int burst_limit = 50;
    bool synthetic_fallback = true;
    int search_scan_size = 100;

    static ResolverOptions from_config(const Config& config);
};

// Resolves pools through cache -> indexed service -> chain -> synthetic.
// Public methods never throw; every outcome is reported in the FetchResult
// together with its provenance and latency.
class PoolResolver {
public:
    PoolResolver(std::shared_ptr<PoolCache> cache,
                 std::shared_ptr<IndexedPoolSource> indexed,
                 std::shared_ptr<ChainPoolSource> chain,
                 ResolverOptions options,
                 std::shared_ptr<StopSignal> stop = nullptr);
    ~PoolResolver();

    FetchResult<PoolRecord> get_pool(const std::string& address, int64_t chain_id);

    // Token order does not matter
    FetchResult<PoolRecord> get_pool_by_tokens(const std::string& token_a, const std::string& token_b,
                                               FeeTier fee, int64_t chain_id);

    FetchResult<std::vector<PoolRecord>> get_pools(int64_t chain_id, const PoolQuery& query);

    // Largest pools by TVL, ignoring pools under $1000
    FetchResult<std::vector<PoolRecord>> get_top_pools(int64_t chain_id, int limit = 10);

    // An address searches pools holding that token. Anything else is matched
    // against token symbols of the top search_scan_size pools only.
    FetchResult<std::vector<PoolRecord>> search_pools(const std::string& query, int64_t chain_id,
                                                      const SearchOptions& options = {});

    // Independent, best-effort; failures are aggregated into `error`
    FetchResult<std::vector<PoolRecord>> batch_get_pools(const std::vector<PoolRequest>& requests);

    FetchResult<PoolRecord> resolve(const PoolRequest& request);

    CacheStats cache_stats() const;
    void clear_cache();

    // Cancels pending waits and flushes the cache
    void shutdown();

    PoolCache& cache() { return *cache_; }

private:
    using Lookup = std::function<std::optional<PoolRecord>()>;

    FetchResult<PoolRecord> lookup(const LookupKey& key,
                                   const std::string& description,
                                   const Lookup& from_indexed,
                                   const Lookup& from_chain,
                                   const std::function<PoolRecord()>& synthesize);

    FetchResult<PoolRecord> fetch_from_sources(const LookupKey& key,
                                               const std::string& description,
                                               const Lookup& from_indexed,
                                               const Lookup& from_chain,
                                               const std::function<PoolRecord()>& synthesize);

    FetchResult<std::vector<PoolRecord>> fetch_pools(int64_t chain_id, const PoolQuery& query);

    std::shared_ptr<PoolCache> cache_;
    std::shared_ptr<IndexedPoolSource> indexed_;
    std::shared_ptr<ChainPoolSource> chain_;
    ResolverOptions options_;
    std::shared_ptr<StopSignal> stop_;
    RateLimiter limiter_;
    RetryExecutor retry_;

    std::mutex inflight_mutex_;
    std::unordered_map<std::string, std::shared_future<FetchResult<PoolRecord>>> inflight_;
};
