#pragma once

#include "config.hpp"
#include "pool_source.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

// Reads Uniswap V3 pool state straight from the chain over JSON-RPC eth_call.
// USD aggregates are not available on chain and come back as "0".
class ChainRpcClient : public ChainPoolSource {
public:
    ChainRpcClient(std::map<int64_t, std::string> rpc_urls, int64_t timeout_ms);
    explicit ChainRpcClient(const Config& config);
    ~ChainRpcClient() override;

    std::optional<PoolRecord> get_pool_on_chain(const std::string& token_a,
                                                const std::string& token_b,
                                                FeeTier fee, int64_t chain_id) override;
    std::optional<PoolRecord> get_pool_at(const std::string& address, int64_t chain_id) override;
    bool supports_chain(int64_t chain_id) const override;

    // Uniswap V3 factory deployment for a chain
    static std::optional<std::string> factory_address(int64_t chain_id);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
