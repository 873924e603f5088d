#include "types.hpp"
#include "util.hpp"
#include <utility>
#include <stdexcept>

std::optional<FeeTier> fee_tier_from_int(int64_t value) {
    switch (value) {
        case 100: return FeeTier::Lowest;
        case 500: return FeeTier::Low;
        case 3000: return FeeTier::Medium;
        case 10000: return FeeTier::High;
        default: return std::nullopt;
    }
}

int fee_tier_value(FeeTier fee) {
    return static_cast<int>(fee);
}

int default_tick_spacing(FeeTier fee) {
    switch (fee) {
        case FeeTier::Lowest: return 1;
        case FeeTier::Low: return 10;
        case FeeTier::Medium: return 60;
        case FeeTier::High: return 200;
    }
    return 60;
}

std::string to_string(PoolSource source) {
    switch (source) {
        case PoolSource::Cache: return "cache";
        case PoolSource::IndexedService: return "indexed-service";
        case PoolSource::Chain: return "chain";
        case PoolSource::Synthetic: return "synthetic";
    }
    return "unknown";
}

std::optional<PoolSource> pool_source_from_string(const std::string& value) {
    if (value == "cache") return PoolSource::Cache;
    if (value == "indexed-service") return PoolSource::IndexedService;
    if (value == "chain") return PoolSource::Chain;
    if (value == "synthetic") return PoolSource::Synthetic;
    return std::nullopt;
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::UpstreamTimeout: return "upstream_timeout";
        case ErrorKind::UpstreamError: return "upstream_error";
        case ErrorKind::RateLimited: return "rate_limited";
        case ErrorKind::Unavailable: return "unavailable";
        case ErrorKind::PersistenceWarning: return "persistence_warning";
        case ErrorKind::InvalidRequest: return "invalid_request";
    }
    return "unknown";
}

std::string to_string(PoolOrderBy order_by) {
    switch (order_by) {
        case PoolOrderBy::TotalValueLockedUsd: return "totalValueLockedUSD";
        case PoolOrderBy::VolumeUsd: return "volumeUSD";
        case PoolOrderBy::FeesUsd: return "feesUSD";
        case PoolOrderBy::CreatedAtTimestamp: return "createdAtTimestamp";
    }
    return "totalValueLockedUSD";
}

std::optional<PoolOrderBy> pool_order_by_from_string(const std::string& value) {
    std::string v = util::to_lower(value);
    if (v == "totalvaluelockedusd" || v == "tvl") return PoolOrderBy::TotalValueLockedUsd;
    if (v == "volumeusd" || v == "volume") return PoolOrderBy::VolumeUsd;
    if (v == "feesusd" || v == "fees") return PoolOrderBy::FeesUsd;
    if (v == "createdattimestamp" || v == "created") return PoolOrderBy::CreatedAtTimestamp;
    return std::nullopt;
}

std::pair<std::string, std::string> canonical_pair(const std::string& token_a, const std::string& token_b) {
    std::string a = util::to_lower(token_a);
    std::string b = util::to_lower(token_b);
    if (b < a) {
        std::swap(a, b);
    }
    return {a, b};
}

void canonicalize(PoolRecord& record) {
    record.address = util::to_lower(record.address);
    record.token_a.address = util::to_lower(record.token_a.address);
    record.token_b.address = util::to_lower(record.token_b.address);

    if (record.token_b.address < record.token_a.address) {
        std::swap(record.token_a, record.token_b);
        std::swap(record.total_value_locked_token_a, record.total_value_locked_token_b);
        std::swap(record.fee_growth_global_a_x128, record.fee_growth_global_b_x128);
    }
}

void to_json(nlohmann::json& j, const TokenInfo& token) {
    j = nlohmann::json{
        {"address", token.address},
        {"symbol", token.symbol},
        {"name", token.name},
        {"decimals", token.decimals}
    };
}

void from_json(const nlohmann::json& j, TokenInfo& token) {
    token.address = j.at("address").get<std::string>();
    token.symbol = j.value("symbol", "");
    token.name = j.value("name", "");
    token.decimals = j.value("decimals", 18);
}

void to_json(nlohmann::json& j, const PoolRecord& record) {
    j = nlohmann::json{
        {"address", record.address},
        {"chain_id", record.chain_id},
        {"token_a", record.token_a},
        {"token_b", record.token_b},
        {"fee_tier", fee_tier_value(record.fee_tier)},
        {"sqrt_price_x96", record.sqrt_price_x96},
        {"tick", record.tick},
        {"tick_spacing", record.tick_spacing},
        {"liquidity", record.liquidity},
        {"created_at_timestamp", record.created_at_timestamp},
        {"created_at_block", record.created_at_block},
        {"volume_usd", record.volume_usd},
        {"total_value_locked_usd", record.total_value_locked_usd},
        {"total_value_locked_token_a", record.total_value_locked_token_a},
        {"total_value_locked_token_b", record.total_value_locked_token_b},
        {"fees_usd", record.fees_usd},
        {"fee_growth_global_a_x128", record.fee_growth_global_a_x128},
        {"fee_growth_global_b_x128", record.fee_growth_global_b_x128},
        {"synthetic", record.synthetic}
    };
}

void from_json(const nlohmann::json& j, PoolRecord& record) {
    record.address = j.at("address").get<std::string>();
    record.chain_id = j.at("chain_id").get<int64_t>();
    record.token_a = j.at("token_a").get<TokenInfo>();
    record.token_b = j.at("token_b").get<TokenInfo>();

    auto fee = fee_tier_from_int(j.at("fee_tier").get<int64_t>());
    if (!fee) {
        throw std::runtime_error("Unsupported fee tier in pool record");
    }
    record.fee_tier = *fee;

    record.sqrt_price_x96 = j.value("sqrt_price_x96", "");
    record.tick = j.value("tick", 0);
    record.tick_spacing = j.value("tick_spacing", default_tick_spacing(record.fee_tier));
    record.liquidity = j.value("liquidity", "");
    record.created_at_timestamp = j.value("created_at_timestamp", "");
    record.created_at_block = j.value("created_at_block", "");
    record.volume_usd = j.value("volume_usd", "0");
    record.total_value_locked_usd = j.value("total_value_locked_usd", "0");
    record.total_value_locked_token_a = j.value("total_value_locked_token_a", "0");
    record.total_value_locked_token_b = j.value("total_value_locked_token_b", "0");
    record.fees_usd = j.value("fees_usd", "0");
    record.fee_growth_global_a_x128 = j.value("fee_growth_global_a_x128", "0");
    record.fee_growth_global_b_x128 = j.value("fee_growth_global_b_x128", "0");
    record.synthetic = j.value("synthetic", false);
}
