#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

// Identifies one logical pool, either by contract address or by its
// canonical (tokenA, tokenB, fee, chain) tuple.
struct LookupKey {
    enum class Kind { Address, Pair };

    Kind kind = Kind::Address;
    int64_t chain_id = 0;
    std::string address;   // Address form, lower-cased
    std::string token_a;   // Pair form, lower address first
    std::string token_b;
    FeeTier fee_tier = FeeTier::Medium;

    static LookupKey for_address(const std::string& address, int64_t chain_id);
    static LookupKey for_pair(const std::string& token_a, const std::string& token_b,
                              FeeTier fee, int64_t chain_id);
    static LookupKey for_record(const PoolRecord& record);
    static LookupKey pair_of(const PoolRecord& record);

    // pool:{chain}:{address} or pair:{chain}:{token0}:{token1}:{fee}
    std::string str() const;

    bool operator==(const LookupKey& other) const { return str() == other.str(); }
};

// One element of a batch lookup
struct PoolRequest {
    enum class Kind { Address, Tokens };

    Kind kind = Kind::Address;
    int64_t chain_id = 1;
    std::string address;
    std::string token_a;
    std::string token_b;
    FeeTier fee_tier = FeeTier::Medium;

    static PoolRequest by_address(const std::string& address, int64_t chain_id);
    static PoolRequest by_tokens(const std::string& token_a, const std::string& token_b,
                                 FeeTier fee, int64_t chain_id);

    // Short human-readable form used in aggregated batch errors
    std::string describe() const;
};

// Accepts {address, chain} or {token_a, token_b, fee, chain}; throws std::invalid_argument
void from_json(const nlohmann::json& j, PoolRequest& request);
