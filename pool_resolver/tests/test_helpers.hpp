#pragma once
#include "../src/types.hpp"
#include <string>

inline std::string test_address(int n) {
    std::string hex = std::to_string(n);
    return "0x" + std::string(40 - hex.size(), '0') + hex;
}

inline PoolRecord make_pool(const std::string& address,
                            const std::string& token_a,
                            const std::string& token_b,
                            FeeTier fee = FeeTier::Medium,
                            int64_t chain_id = 1,
                            const std::string& tvl_usd = "5000",
                            const std::string& volume_usd = "1000") {
    PoolRecord pool;
    pool.address = address;
    pool.chain_id = chain_id;
    pool.token_a.address = token_a;
    pool.token_a.symbol = "TKA";
    pool.token_a.name = "Token A";
    pool.token_b.address = token_b;
    pool.token_b.symbol = "TKB";
    pool.token_b.name = "Token B";
    pool.fee_tier = fee;
    pool.sqrt_price_x96 = "79228162514264337593543950336";
    pool.tick_spacing = default_tick_spacing(fee);
    pool.liquidity = "1000000";
    pool.created_at_timestamp = "1620000000";
    pool.created_at_block = "12370000";
    pool.volume_usd = volume_usd;
    pool.total_value_locked_usd = tvl_usd;
    pool.total_value_locked_token_a = "10";
    pool.total_value_locked_token_b = "20";
    pool.fees_usd = "3";
    pool.fee_growth_global_a_x128 = "1";
    pool.fee_growth_global_b_x128 = "2";
    return pool;
}
