#include "subgraph_client.hpp"
#include "upstream_error.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

const char* const POOL_FIELDS = R"(
      id
      token0 { id symbol name decimals }
      token1 { id symbol name decimals }
      feeTier
      sqrtPrice
      liquidity
      tick
      tickSpacing
      createdAtTimestamp
      createdAtBlockNumber
      volumeUSD
      totalValueLockedUSD
      totalValueLockedToken0
      totalValueLockedToken1
      feesUSD
      feeGrowthGlobal0X128
      feeGrowthGlobal1X128
)";

std::string pool_query() {
    return fmt::format("query GetPool($poolId: String!) {{\n  pool(id: $poolId) {{{}  }}\n}}", POOL_FIELDS);
}

std::string pools_query() {
    return fmt::format(
        "query GetPools($first: Int!, $skip: Int!, $orderBy: Pool_orderBy!, "
        "$orderDirection: OrderDirection!, $where: Pool_filter) {{\n"
        "  pools(first: $first, skip: $skip, orderBy: $orderBy, "
        "orderDirection: $orderDirection, where: $where) {{{}  }}\n}}",
        POOL_FIELDS);
}

[[noreturn]] void schema_error(const std::string& message) {
    throw UpstreamException(ErrorKind::UpstreamError, "Unexpected subgraph response: " + message, false);
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end()) {
        schema_error(fmt::format("missing field '{}'", field));
    }
    return *it;
}

std::string require_string(const nlohmann::json& obj, const char* field) {
    const auto& value = require_field(obj, field);
    if (!value.is_string()) {
        schema_error(fmt::format("field '{}' must be a string", field));
    }
    return value.get<std::string>();
}

// BigInt/BigDecimal scalars arrive as strings; integers are tolerated
std::string numeric_string(const nlohmann::json& obj, const char* field, bool nullable = false) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) {
        if (nullable) {
            return "0";
        }
        schema_error(fmt::format("missing field '{}'", field));
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<int64_t>());
    }
    schema_error(fmt::format("field '{}' must be numeric", field));
}

int64_t integer_field(const nlohmann::json& obj, const char* field, bool nullable, int64_t fallback) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) {
        if (nullable) {
            return fallback;
        }
        schema_error(fmt::format("missing field '{}'", field));
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        auto parsed = util::parse_int(it->get<std::string>());
        if (parsed) {
            return *parsed;
        }
    }
    schema_error(fmt::format("field '{}' must be an integer", field));
}

TokenInfo parse_token(const nlohmann::json& obj, const char* field) {
    const auto& token = require_field(obj, field);
    if (!token.is_object()) {
        schema_error(fmt::format("field '{}' must be an object", field));
    }

    TokenInfo info;
    info.address = util::to_lower(require_string(token, "id"));
    info.symbol = require_string(token, "symbol");
    info.name = require_string(token, "name");
    info.decimals = static_cast<int>(integer_field(token, "decimals", false, 18));
    if (info.decimals < 0) {
        schema_error(fmt::format("negative decimals for token {}", info.address));
    }
    return info;
}

std::vector<std::string> lower_all(const std::vector<std::string>& values) {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.push_back(util::to_lower(v));
    }
    return out;
}

} // namespace

PoolRecord SubgraphClient::parse_pool(const nlohmann::json& pool, int64_t chain_id) {
    if (!pool.is_object()) {
        schema_error("pool must be an object");
    }

    PoolRecord record;
    record.address = util::to_lower(require_string(pool, "id"));
    record.chain_id = chain_id;
    record.token_a = parse_token(pool, "token0");
    record.token_b = parse_token(pool, "token1");

    int64_t fee = integer_field(pool, "feeTier", false, 0);
    auto tier = fee_tier_from_int(fee);
    if (!tier) {
        schema_error(fmt::format("unsupported fee tier {}", fee));
    }
    record.fee_tier = *tier;

    record.sqrt_price_x96 = numeric_string(pool, "sqrtPrice");
    record.liquidity = numeric_string(pool, "liquidity");
    // Uninitialized pools report a null tick
    record.tick = static_cast<int>(integer_field(pool, "tick", true, 0));
    record.tick_spacing = static_cast<int>(
        integer_field(pool, "tickSpacing", true, default_tick_spacing(record.fee_tier)));

    record.created_at_timestamp = numeric_string(pool, "createdAtTimestamp");
    record.created_at_block = numeric_string(pool, "createdAtBlockNumber");

    record.volume_usd = numeric_string(pool, "volumeUSD", true);
    record.total_value_locked_usd = numeric_string(pool, "totalValueLockedUSD", true);
    record.total_value_locked_token_a = numeric_string(pool, "totalValueLockedToken0", true);
    record.total_value_locked_token_b = numeric_string(pool, "totalValueLockedToken1", true);
    record.fees_usd = numeric_string(pool, "feesUSD", true);
    record.fee_growth_global_a_x128 = numeric_string(pool, "feeGrowthGlobal0X128", true);
    record.fee_growth_global_b_x128 = numeric_string(pool, "feeGrowthGlobal1X128", true);

    canonicalize(record);
    return record;
}

nlohmann::json SubgraphClient::extract_data(const nlohmann::json& response) {
    if (!response.is_object()) {
        schema_error("body must be an object");
    }

    auto errors = response.find("errors");
    if (errors != response.end() && errors->is_array() && !errors->empty()) {
        const auto& first = (*errors)[0];
        std::string message = first.is_object() ? first.value("message", std::string("unknown error"))
                                                : first.dump();
        throw UpstreamException(ErrorKind::UpstreamError, "Subgraph query failed: " + message);
    }

    auto data = response.find("data");
    if (data == response.end() || !data->is_object()) {
        schema_error("missing 'data' object");
    }
    return *data;
}

nlohmann::json SubgraphClient::build_where(const PoolQuery& query) {
    nlohmann::json common = nlohmann::json::object();

    if (!query.fee_tiers.empty()) {
        nlohmann::json tiers = nlohmann::json::array();
        for (auto fee : query.fee_tiers) {
            tiers.push_back(std::to_string(fee_tier_value(fee)));
        }
        common["feeTier_in"] = tiers;
    }
    if (query.min_tvl_usd) {
        common["totalValueLockedUSD_gte"] = fmt::format("{}", *query.min_tvl_usd);
    }
    if (query.min_volume_usd) {
        common["volumeUSD_gte"] = fmt::format("{}", *query.min_volume_usd);
    }

    if (query.token_a && query.token_b) {
        auto pair = canonical_pair(*query.token_a, *query.token_b);
        common["token0"] = pair.first;
        common["token1"] = pair.second;
        return common;
    }

    std::vector<std::string> tokens = lower_all(query.tokens);
    if (query.token_a) {
        tokens.push_back(util::to_lower(*query.token_a));
    }
    if (query.token_b) {
        tokens.push_back(util::to_lower(*query.token_b));
    }
    if (tokens.empty()) {
        return common;
    }

    // Either side may hold the token; `or` cannot be mixed with column
    // filters at the same level, so each branch carries them
    nlohmann::json side0 = common;
    nlohmann::json side1 = common;
    side0["token0_in"] = tokens;
    side1["token1_in"] = tokens;
    return nlohmann::json{{"or", nlohmann::json::array({side0, side1})}};
}

class SubgraphClient::Impl {
public:
    Impl(std::map<int64_t, std::string> endpoints, std::string api_key, int64_t timeout_ms)
        : endpoints_(std::move(endpoints)), api_key_(std::move(api_key)), timeout_ms_(timeout_ms) {}

    std::optional<PoolRecord> get_pool(const std::string& address, int64_t chain_id) {
        nlohmann::json variables = {{"poolId", util::to_lower(address)}};
        auto data = query(chain_id, pool_query(), variables);

        const auto& pool = require_field(data, "pool");
        if (pool.is_null()) {
            return std::nullopt;
        }
        return parse_pool(pool, chain_id);
    }

    std::vector<PoolRecord> get_pools(int64_t chain_id, const PoolQuery& pool_query_in) {
        nlohmann::json variables = {
            {"first", std::clamp(pool_query_in.first, 1, 1000)},
            {"skip", std::max(pool_query_in.skip, 0)},
            {"orderBy", to_string(pool_query_in.order_by)},
            {"orderDirection", pool_query_in.order_direction == OrderDirection::Asc ? "asc" : "desc"},
            {"where", build_where(pool_query_in)}
        };
        auto data = query(chain_id, pools_query(), variables);

        const auto& pools = require_field(data, "pools");
        if (!pools.is_array()) {
            schema_error("field 'pools' must be an array");
        }

        std::vector<PoolRecord> records;
        records.reserve(pools.size());
        for (const auto& pool : pools) {
            records.push_back(parse_pool(pool, chain_id));
        }

        spdlog::debug("Subgraph returned {} pools for chain {}", records.size(), chain_id);
        return records;
    }

    std::optional<PoolRecord> get_pool_by_tokens(const std::string& token_a, const std::string& token_b,
                                                 FeeTier fee, int64_t chain_id) {
        auto pair = canonical_pair(token_a, token_b);

        PoolQuery q;
        q.token_a = pair.first;
        q.token_b = pair.second;
        q.fee_tiers = {fee};
        q.first = 1;

        auto pools = get_pools(chain_id, q);
        if (pools.empty()) {
            return std::nullopt;
        }
        return pools.front();
    }

    bool supports_chain(int64_t chain_id) const {
        return endpoints_.count(chain_id) > 0;
    }

private:
    nlohmann::json query(int64_t chain_id, const std::string& graphql, const nlohmann::json& variables) {
        auto it = endpoints_.find(chain_id);
        if (it == endpoints_.end()) {
            throw UpstreamException(ErrorKind::UpstreamError,
                                    fmt::format("No subgraph endpoint for chain {}", chain_id), false);
        }

        nlohmann::json payload = {{"query", graphql}, {"variables", variables}};

        cpr::Header headers{{"Content-Type", "application/json"}, {"User-Agent", "pool-resolver/1.0"}};
        if (!api_key_.empty()) {
            headers["Authorization"] = "Bearer " + api_key_;
        }

        auto response = cpr::Post(
            cpr::Url{it->second},
            cpr::Body{payload.dump()},
            headers,
            cpr::Timeout{static_cast<int32_t>(timeout_ms_)}
        );

        if (response.error) {
            if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
                throw UpstreamException(ErrorKind::UpstreamTimeout,
                                        fmt::format("Subgraph request timed out after {} ms", timeout_ms_));
            }
            throw UpstreamException(ErrorKind::UpstreamError,
                                    "Subgraph transport error: " + response.error.message);
        }

        if (response.status_code == 429) {
            throw UpstreamException(ErrorKind::RateLimited, "Subgraph rate limit hit (429)");
        }
        if (response.status_code >= 500) {
            throw UpstreamException(ErrorKind::UpstreamError,
                                    fmt::format("Subgraph returned status {}", response.status_code));
        }
        if (response.status_code != 200) {
            throw UpstreamException(ErrorKind::UpstreamError,
                                    fmt::format("Subgraph rejected query with status {}", response.status_code),
                                    false);
        }

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(response.text);
        } catch (const nlohmann::json::parse_error& e) {
            schema_error(std::string("invalid JSON: ") + e.what());
        }

        return extract_data(body);
    }

    std::map<int64_t, std::string> endpoints_;
    std::string api_key_;
    int64_t timeout_ms_;
};

SubgraphClient::SubgraphClient(std::map<int64_t, std::string> endpoints, std::string api_key, int64_t timeout_ms)
    : pImpl_(std::make_unique<Impl>(std::move(endpoints), std::move(api_key), timeout_ms)) {}

SubgraphClient::SubgraphClient(const Config& config)
    : SubgraphClient(config.subgraph_urls, config.subgraph_api_key, config.request_timeout_ms) {}

SubgraphClient::~SubgraphClient() = default;

std::optional<PoolRecord> SubgraphClient::get_pool(const std::string& address, int64_t chain_id) {
    return pImpl_->get_pool(address, chain_id);
}

std::vector<PoolRecord> SubgraphClient::get_pools(int64_t chain_id, const PoolQuery& query) {
    return pImpl_->get_pools(chain_id, query);
}

std::optional<PoolRecord> SubgraphClient::get_pool_by_tokens(const std::string& token_a, const std::string& token_b,
                                                             FeeTier fee, int64_t chain_id) {
    return pImpl_->get_pool_by_tokens(token_a, token_b, fee, chain_id);
}

bool SubgraphClient::supports_chain(int64_t chain_id) const {
    return pImpl_->supports_chain(chain_id);
}
