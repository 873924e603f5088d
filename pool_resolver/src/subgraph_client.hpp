#pragma once

#include "config.hpp"
#include "pool_source.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// GraphQL client for the Uniswap V3 subgraphs.
// Every response is checked against the expected pool schema before it is
// converted; a mismatch is a non-retryable UpstreamException.
class SubgraphClient : public IndexedPoolSource {
public:
    SubgraphClient(std::map<int64_t, std::string> endpoints,
                   std::string api_key,
                   int64_t timeout_ms);
    explicit SubgraphClient(const Config& config);
    ~SubgraphClient() override;

    std::optional<PoolRecord> get_pool(const std::string& address, int64_t chain_id) override;
    std::vector<PoolRecord> get_pools(int64_t chain_id, const PoolQuery& query) override;
    std::optional<PoolRecord> get_pool_by_tokens(const std::string& token_a,
                                                 const std::string& token_b,
                                                 FeeTier fee, int64_t chain_id) override;
    bool supports_chain(int64_t chain_id) const override;

    // Converts one `pool` object from a response into a canonical record
    static PoolRecord parse_pool(const nlohmann::json& pool, int64_t chain_id);

    // Extracts `data` from a GraphQL response body, mapping `errors` to UpstreamException
    static nlohmann::json extract_data(const nlohmann::json& response);

    // Pool_filter for a query
    static nlohmann::json build_where(const PoolQuery& query);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
