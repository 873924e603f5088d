#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

// Uniswap V3 fee tiers, in hundredths of a basis point
enum class FeeTier : int {
    Lowest = 100,   // 0.01%
    Low = 500,      // 0.05%
    Medium = 3000,  // 0.3%
    High = 10000    // 1%
};

std::optional<FeeTier> fee_tier_from_int(int64_t value);
int fee_tier_value(FeeTier fee);
int default_tick_spacing(FeeTier fee);

// Where a result came from
enum class PoolSource {
    Cache,
    IndexedService,
    Chain,
    Synthetic
};

std::string to_string(PoolSource source);
std::optional<PoolSource> pool_source_from_string(const std::string& value);

enum class ErrorKind {
    None,
    NotFound,
    UpstreamTimeout,
    UpstreamError,
    RateLimited,
    Unavailable,
    PersistenceWarning,
    InvalidRequest
};

std::string to_string(ErrorKind kind);

struct TokenInfo {
    std::string address;
    std::string symbol;
    std::string name;
    int decimals = 18;
};

struct PoolRecord {
    std::string address;
    int64_t chain_id = 0;
    TokenInfo token_a;
    TokenInfo token_b;
    FeeTier fee_tier = FeeTier::Medium;

    // Concentrated-liquidity state, passed through untouched
    std::string sqrt_price_x96;
    int tick = 0;
    int tick_spacing = 0;
    std::string liquidity;

    std::string created_at_timestamp;
    std::string created_at_block;

    // Aggregates, refreshed on every successful fetch
    std::string volume_usd;
    std::string total_value_locked_usd;
    std::string total_value_locked_token_a;
    std::string total_value_locked_token_b;
    std::string fees_usd;
    std::string fee_growth_global_a_x128;
    std::string fee_growth_global_b_x128;

    // Placeholder data produced when no real source answered
    bool synthetic = false;
};

// Lower-cases addresses and orders the pair lower address first.
// Per-token aggregates follow their token when the pair is swapped.
void canonicalize(PoolRecord& record);

// Ordered (lower, higher) pair of lower-cased token addresses
std::pair<std::string, std::string> canonical_pair(const std::string& token_a, const std::string& token_b);

enum class PoolOrderBy {
    TotalValueLockedUsd,
    VolumeUsd,
    FeesUsd,
    CreatedAtTimestamp
};

enum class OrderDirection { Asc, Desc };

std::string to_string(PoolOrderBy order_by);
std::optional<PoolOrderBy> pool_order_by_from_string(const std::string& value);

struct PoolQuery {
    std::optional<std::string> token_a;
    std::optional<std::string> token_b;
    std::vector<std::string> tokens;  // pools holding any of these on either side
    std::vector<FeeTier> fee_tiers;
    std::optional<double> min_tvl_usd;
    std::optional<double> min_volume_usd;
    PoolOrderBy order_by = PoolOrderBy::TotalValueLockedUsd;
    OrderDirection order_direction = OrderDirection::Desc;
    int first = 100;
    int skip = 0;
};

struct SearchOptions {
    std::vector<FeeTier> fee_tiers;
    std::optional<double> min_tvl_usd;
    std::optional<double> min_volume_usd;
    int limit = 20;
};

template <typename T>
struct FetchResult {
    bool success = false;
    std::optional<T> data;
    std::optional<std::string> error;
    ErrorKind error_kind = ErrorKind::None;
    PoolSource source = PoolSource::IndexedService;
    int64_t timestamp_ms = 0;
    int64_t latency_ms = 0;
};

void to_json(nlohmann::json& j, const TokenInfo& token);
void from_json(const nlohmann::json& j, TokenInfo& token);
void to_json(nlohmann::json& j, const PoolRecord& record);
void from_json(const nlohmann::json& j, PoolRecord& record);

template <typename T>
void to_json(nlohmann::json& j, const FetchResult<T>& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"source", to_string(result.source)},
        {"timestamp", result.timestamp_ms},
        {"latency_ms", result.latency_ms}
    };
    if (result.data) {
        j["data"] = *result.data;
    }
    if (result.error) {
        j["error"] = *result.error;
        j["error_kind"] = to_string(result.error_kind);
    }
}
