#include "pool_resolver.hpp"
#include "pool_filters.hpp"
#include "upstream_error.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

// sqrt(1) * 2^96: price 1.0, tick 0
const char* const NEUTRAL_SQRT_PRICE_X96 = "79228162514264337593543950336";

class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

template <typename T>
FetchResult<T> success(T data, PoolSource source, const Stopwatch& timer) {
    FetchResult<T> result;
    result.success = true;
    result.data = std::move(data);
    result.source = source;
    result.timestamp_ms = util::current_timestamp_ms();
    result.latency_ms = timer.elapsed_ms();
    return result;
}

template <typename T>
FetchResult<T> failure(ErrorKind kind, std::string error, const Stopwatch& timer,
                       PoolSource source = PoolSource::IndexedService) {
    FetchResult<T> result;
    result.success = false;
    result.error = std::move(error);
    result.error_kind = kind;
    result.source = source;
    result.timestamp_ms = util::current_timestamp_ms();
    result.latency_ms = timer.elapsed_ms();
    return result;
}

// Stable 40-hex-digit placeholder address for a lookup key (FNV-1a, three rounds)
std::string synthetic_address(const std::string& seed) {
    std::string hex;
    uint64_t hash = 14695981039346656037ull;
    for (int round = 0; hex.size() < 40; ++round) {
        for (char c : seed) {
            hash ^= static_cast<unsigned char>(c);
            hash *= 1099511628211ull;
        }
        hash ^= static_cast<uint64_t>(round);
        hex += fmt::format("{:016x}", hash);
    }
    return "0x" + hex.substr(0, 40);
}

PoolRecord synthetic_pool(const std::string& address, const std::string& token_a, const std::string& token_b,
                          FeeTier fee, int64_t chain_id) {
    PoolRecord record;
    record.address = address;
    record.chain_id = chain_id;
    record.token_a.address = token_a;
    record.token_a.symbol = "UNKNOWN";
    record.token_a.name = "Unknown Token";
    record.token_b.address = token_b;
    record.token_b.symbol = "UNKNOWN";
    record.token_b.name = "Unknown Token";
    record.fee_tier = fee;
    record.sqrt_price_x96 = NEUTRAL_SQRT_PRICE_X96;
    record.tick = 0;
    record.tick_spacing = default_tick_spacing(fee);
    record.liquidity = "0";
    record.created_at_timestamp = "0";
    record.created_at_block = "0";
    record.volume_usd = "0";
    record.total_value_locked_usd = "0";
    record.total_value_locked_token_a = "0";
    record.total_value_locked_token_b = "0";
    record.fees_usd = "0";
    record.fee_growth_global_a_x128 = "0";
    record.fee_growth_global_b_x128 = "0";
    record.synthetic = true;
    canonicalize(record);
    return record;
}

// Larger is further from authoritative data
int degradation(PoolSource source) {
    switch (source) {
        case PoolSource::Cache: return 0;
        case PoolSource::IndexedService: return 1;
        case PoolSource::Chain: return 2;
        case PoolSource::Synthetic: return 3;
    }
    return 0;
}

std::optional<std::string> validate_query_tokens(const PoolQuery& query) {
    auto check = [](const std::string& token) -> std::optional<std::string> {
        if (!util::is_valid_evm_address(token)) {
            return fmt::format("Invalid token address '{}'", token);
        }
        return std::nullopt;
    };

    if (query.token_a) {
        if (auto err = check(*query.token_a)) return err;
    }
    if (query.token_b) {
        if (auto err = check(*query.token_b)) return err;
    }
    for (const auto& token : query.tokens) {
        if (auto err = check(token)) return err;
    }
    if (query.token_a && query.token_b && util::to_lower(*query.token_a) == util::to_lower(*query.token_b)) {
        return std::string("token_a and token_b must differ");
    }
    return std::nullopt;
}

} // namespace

ResolverOptions ResolverOptions::from_config(const Config& config) {
    ResolverOptions options;
    options.retry.max_retries = config.max_retries;
    options.retry.base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
    options.retry.max_delay = std::chrono::milliseconds(config.retry_max_delay_ms);
    options.rate_limit_per_second = config.rate_limit_per_second;
    options.burst_limit = config.burst_limit;
    options.synthetic_fallback = config.synthetic_fallback;
    options.search_scan_size = config.search_scan_size;
    return options;
}

PoolResolver::PoolResolver(std::shared_ptr<PoolCache> cache,
                           std::shared_ptr<IndexedPoolSource> indexed,
                           std::shared_ptr<ChainPoolSource> chain,
                           ResolverOptions options,
                           std::shared_ptr<StopSignal> stop)
    : cache_(std::move(cache)),
      indexed_(std::move(indexed)),
      chain_(std::move(chain)),
      options_(options),
      stop_(stop ? std::move(stop) : std::make_shared<StopSignal>()),
      limiter_(options.rate_limit_per_second, std::chrono::milliseconds(1000), stop_),
      retry_(options.retry, stop_) {
    if (!cache_ || !indexed_) {
        throw std::invalid_argument("PoolResolver requires a cache and an indexed source");
    }
    if (options_.burst_limit < 1) {
        options_.burst_limit = 1;
    }
}

PoolResolver::~PoolResolver() = default;

FetchResult<PoolRecord> PoolResolver::get_pool(const std::string& address, int64_t chain_id) {
    Stopwatch timer;

    if (!util::is_valid_evm_address(address)) {
        return failure<PoolRecord>(ErrorKind::InvalidRequest,
                                   fmt::format("Invalid pool address '{}'", address), timer);
    }
    if (chain_id <= 0) {
        return failure<PoolRecord>(ErrorKind::InvalidRequest,
                                   fmt::format("Invalid chain id {}", chain_id), timer);
    }

    const std::string pool_address = util::to_lower(address);
    auto key = LookupKey::for_address(pool_address, chain_id);
    auto description = fmt::format("pool {} on chain {}", pool_address, chain_id);

    auto result = lookup(
        key, description,
        [this, pool_address, chain_id]() { return indexed_->get_pool(pool_address, chain_id); },
        [this, pool_address, chain_id]() { return chain_->get_pool_at(pool_address, chain_id); },
        [pool_address, chain_id]() {
            return synthetic_pool(pool_address, "0x0000000000000000000000000000000000000000",
                                  "0x0000000000000000000000000000000000000001", FeeTier::Medium, chain_id);
        });

    result.latency_ms = timer.elapsed_ms();
    return result;
}

FetchResult<PoolRecord> PoolResolver::get_pool_by_tokens(const std::string& token_a, const std::string& token_b,
                                                         FeeTier fee, int64_t chain_id) {
    Stopwatch timer;

    if (!util::is_valid_evm_address(token_a) || !util::is_valid_evm_address(token_b)) {
        return failure<PoolRecord>(ErrorKind::InvalidRequest,
                                   fmt::format("Invalid token address in pair {}/{}", token_a, token_b), timer);
    }
    if (util::to_lower(token_a) == util::to_lower(token_b)) {
        return failure<PoolRecord>(ErrorKind::InvalidRequest, "A pool needs two distinct tokens", timer);
    }
    if (chain_id <= 0) {
        return failure<PoolRecord>(ErrorKind::InvalidRequest,
                                   fmt::format("Invalid chain id {}", chain_id), timer);
    }

    auto pair = canonical_pair(token_a, token_b);
    auto key = LookupKey::for_pair(pair.first, pair.second, fee, chain_id);
    auto description = fmt::format("{}/{} fee {} on chain {}", pair.first, pair.second,
                                   fee_tier_value(fee), chain_id);

    auto result = lookup(
        key, description,
        [this, pair, fee, chain_id]() {
            return indexed_->get_pool_by_tokens(pair.first, pair.second, fee, chain_id);
        },
        [this, pair, fee, chain_id]() {
            return chain_->get_pool_on_chain(pair.first, pair.second, fee, chain_id);
        },
        [key, pair, fee, chain_id]() {
            return synthetic_pool(synthetic_address(key.str()), pair.first, pair.second, fee, chain_id);
        });

    result.latency_ms = timer.elapsed_ms();
    return result;
}

FetchResult<PoolRecord> PoolResolver::lookup(const LookupKey& key,
                                             const std::string& description,
                                             const Lookup& from_indexed,
                                             const Lookup& from_chain,
                                             const std::function<PoolRecord()>& synthesize) {
    Stopwatch timer;

    if (auto cached = cache_->get(key)) {
        spdlog::debug("Cache hit for {}", description);
        return success(std::move(*cached), PoolSource::Cache, timer);
    }

    // Single-flight: one upstream fetch per key, later callers share its outcome
    std::promise<FetchResult<PoolRecord>> promise;
    std::shared_future<FetchResult<PoolRecord>> pending;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(key.str());
        if (it != inflight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            inflight_.emplace(key.str(), pending);
            leader = true;
        }
    }

    if (!leader) {
        spdlog::debug("Joining in-flight fetch for {}", description);
        return pending.get();
    }

    FetchResult<PoolRecord> result;
    try {
        // A previous leader may have filled the cache since our miss
        if (cache_->has(key)) {
            if (auto cached = cache_->get(key)) {
                result = success(std::move(*cached), PoolSource::Cache, timer);
            }
        }
        if (!result.success) {
            result = fetch_from_sources(key, description, from_indexed, from_chain, synthesize);
        }
    } catch (const std::exception& e) {
        spdlog::error("Unexpected failure resolving {}: {}", description, e.what());
        result = failure<PoolRecord>(ErrorKind::Unavailable, e.what(), timer);
    }

    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_.erase(key.str());
    }
    promise.set_value(result);
    return result;
}

FetchResult<PoolRecord> PoolResolver::fetch_from_sources(const LookupKey& key,
                                                         const std::string& description,
                                                         const Lookup& from_indexed,
                                                         const Lookup& from_chain,
                                                         const std::function<PoolRecord()>& synthesize) {
    Stopwatch timer;
    std::vector<std::string> errors;
    bool indexed_absent = false;
    bool chain_consulted = false;
    bool chain_absent = false;

    if (indexed_->supports_chain(key.chain_id)) {
        if (!limiter_.acquire()) {
            return failure<PoolRecord>(ErrorKind::Unavailable, "Shutting down", timer);
        }

        try {
            auto record = retry_.run(from_indexed);
            if (record) {
                if (record->chain_id == 0) record->chain_id = key.chain_id;
                cache_->set(*record, std::nullopt, PoolSource::IndexedService);
                return success(std::move(*record), PoolSource::IndexedService, timer);
            }
            indexed_absent = true;
            spdlog::info("Indexed service has no {}", description);
        } catch (const UpstreamException& e) {
            spdlog::warn("Indexed service failed for {} ({}): {}", description, to_string(e.kind()), e.what());
            errors.push_back(fmt::format("indexed service: {}", e.what()));
        } catch (const std::exception& e) {
            spdlog::warn("Indexed service failed for {}: {}", description, e.what());
            errors.push_back(fmt::format("indexed service: {}", e.what()));
        }
    } else {
        errors.push_back(fmt::format("indexed service: no endpoint for chain {}", key.chain_id));
    }

    if (chain_ && chain_->supports_chain(key.chain_id) && !stop_->stop_requested()) {
        chain_consulted = true;
        spdlog::info("Falling back to chain read for {}", description);
        try {
            auto record = from_chain();
            if (record) {
                if (record->chain_id == 0) record->chain_id = key.chain_id;
                cache_->set(*record, std::nullopt, PoolSource::Chain);
                return success(std::move(*record), PoolSource::Chain, timer);
            }
            chain_absent = true;
        } catch (const std::exception& e) {
            spdlog::warn("Chain fallback failed for {}: {}", description, e.what());
            errors.push_back(fmt::format("chain: {}", e.what()));
        }
    }

    // Every consulted source said the pool does not exist
    if (indexed_absent && (!chain_consulted || chain_absent)) {
        return failure<PoolRecord>(ErrorKind::NotFound, fmt::format("No {}", description), timer);
    }

    std::string joined;
    for (const auto& err : errors) {
        if (!joined.empty()) joined += "; ";
        joined += err;
    }

    if (options_.synthetic_fallback) {
        spdlog::warn("All sources failed for {}, returning synthetic placeholder", description);
        auto result = success(synthesize(), PoolSource::Synthetic, timer);
        result.error = "Synthetic placeholder, no source answered: " + joined;
        result.error_kind = ErrorKind::Unavailable;
        return result;
    }

    return failure<PoolRecord>(ErrorKind::Unavailable,
                               fmt::format("No source could resolve {}: {}", description, joined), timer);
}

FetchResult<std::vector<PoolRecord>> PoolResolver::fetch_pools(int64_t chain_id, const PoolQuery& query) {
    Stopwatch timer;

    if (!indexed_->supports_chain(chain_id)) {
        return failure<std::vector<PoolRecord>>(ErrorKind::Unavailable,
            fmt::format("No indexed service for chain {}", chain_id), timer);
    }

    if (!limiter_.acquire()) {
        return failure<std::vector<PoolRecord>>(ErrorKind::Unavailable, "Shutting down", timer);
    }

    try {
        auto records = retry_.run([this, chain_id, &query]() { return indexed_->get_pools(chain_id, query); });
        // The service already skipped; re-apply filters, order and the page size locally
        PoolQuery local = query;
        local.skip = 0;
        records = apply_query(std::move(records), local);

        for (auto& record : records) {
            if (record.chain_id == 0) record.chain_id = chain_id;
            cache_->set(record, std::nullopt, PoolSource::IndexedService);
        }

        return success(std::move(records), PoolSource::IndexedService, timer);
    } catch (const std::exception& e) {
        spdlog::warn("Pool list query failed on chain {}: {}", chain_id, e.what());
        return failure<std::vector<PoolRecord>>(ErrorKind::Unavailable, e.what(), timer);
    }
}

FetchResult<std::vector<PoolRecord>> PoolResolver::get_pools(int64_t chain_id, const PoolQuery& query) {
    Stopwatch timer;

    if (chain_id <= 0) {
        return failure<std::vector<PoolRecord>>(ErrorKind::InvalidRequest,
                                                fmt::format("Invalid chain id {}", chain_id), timer);
    }
    if (auto error = validate_query_tokens(query)) {
        return failure<std::vector<PoolRecord>>(ErrorKind::InvalidRequest, *error, timer);
    }

    auto result = fetch_pools(chain_id, query);
    result.latency_ms = timer.elapsed_ms();
    return result;
}

FetchResult<std::vector<PoolRecord>> PoolResolver::get_top_pools(int64_t chain_id, int limit) {
    PoolQuery query;
    query.first = std::max(limit, 1);
    query.order_by = PoolOrderBy::TotalValueLockedUsd;
    query.order_direction = OrderDirection::Desc;
    query.min_tvl_usd = 1000.0;
    return get_pools(chain_id, query);
}

FetchResult<std::vector<PoolRecord>> PoolResolver::search_pools(const std::string& query, int64_t chain_id,
                                                                const SearchOptions& options) {
    Stopwatch timer;
    const std::string term = util::trim(query);

    if (term.empty()) {
        return failure<std::vector<PoolRecord>>(ErrorKind::InvalidRequest, "Empty search query", timer);
    }
    if (chain_id <= 0) {
        return failure<std::vector<PoolRecord>>(ErrorKind::InvalidRequest,
                                                fmt::format("Invalid chain id {}", chain_id), timer);
    }

    PoolQuery pool_query;
    pool_query.order_by = PoolOrderBy::TotalValueLockedUsd;
    pool_query.order_direction = OrderDirection::Desc;
    pool_query.fee_tiers = options.fee_tiers;
    pool_query.min_tvl_usd = options.min_tvl_usd;
    pool_query.min_volume_usd = options.min_volume_usd;

    const bool by_token = util::is_valid_evm_address(term);
    if (by_token) {
        pool_query.tokens = {util::to_lower(term)};
        pool_query.first = std::max(options.limit, 1);
    } else {
        pool_query.first = options_.search_scan_size;
    }

    auto fetched = fetch_pools(chain_id, pool_query);
    if (!fetched.success) {
        fetched.latency_ms = timer.elapsed_ms();
        return fetched;
    }

    auto records = by_token ? match_token(*fetched.data, term) : match_symbol(*fetched.data, term);
    records = apply_search_options(std::move(records), options);

    spdlog::debug("Search '{}' on chain {} matched {} pools", term, chain_id, records.size());
    return success(std::move(records), PoolSource::IndexedService, timer);
}

FetchResult<PoolRecord> PoolResolver::resolve(const PoolRequest& request) {
    if (request.kind == PoolRequest::Kind::Address) {
        return get_pool(request.address, request.chain_id);
    }
    return get_pool_by_tokens(request.token_a, request.token_b, request.fee_tier, request.chain_id);
}

FetchResult<std::vector<PoolRecord>> PoolResolver::batch_get_pools(const std::vector<PoolRequest>& requests) {
    Stopwatch timer;

    std::vector<FetchResult<PoolRecord>> outcomes(requests.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next++; i < requests.size(); i = next++) {
            try {
                outcomes[i] = resolve(requests[i]);
            } catch (const std::exception& e) {
                outcomes[i] = failure<PoolRecord>(ErrorKind::Unavailable, e.what(), timer);
            }
        }
    };

    size_t worker_count = std::min(requests.size(), static_cast<size_t>(options_.burst_limit));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    std::vector<PoolRecord> records;
    std::string errors;
    std::optional<ErrorKind> first_error_kind;
    PoolSource source = PoolSource::Cache;

    for (size_t i = 0; i < outcomes.size(); ++i) {
        auto& outcome = outcomes[i];
        if (outcome.success && outcome.data) {
            if (degradation(outcome.source) > degradation(source)) {
                source = outcome.source;
            }
            records.push_back(std::move(*outcome.data));
            continue;
        }

        if (!errors.empty()) errors += "; ";
        errors += fmt::format("[{}] {}: {}", i, requests[i].describe(), outcome.error.value_or("unknown error"));
        if (!first_error_kind) first_error_kind = outcome.error_kind;
    }

    FetchResult<std::vector<PoolRecord>> result;
    result.success = !records.empty() || requests.empty();
    result.source = source;
    if (!errors.empty()) {
        result.error = errors;
        result.error_kind = first_error_kind.value_or(ErrorKind::Unavailable);
    }
    result.data = std::move(records);
    result.timestamp_ms = util::current_timestamp_ms();
    result.latency_ms = timer.elapsed_ms();

    spdlog::info("Batch of {} resolved {} pools in {} ms",
                 requests.size(), result.data->size(), result.latency_ms);
    return result;
}

CacheStats PoolResolver::cache_stats() const {
    return cache_->stats();
}

void PoolResolver::clear_cache() {
    cache_->clear();
    spdlog::info("Pool cache cleared");
}

void PoolResolver::shutdown() {
    stop_->request_stop();
    cache_->shutdown();
}
