#include "chain_rpc_client.hpp"
#include "abi.hpp"
#include "upstream_error.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>

namespace {

// Function selectors
const char* const GET_POOL = "0x1698ee82";        // getPool(address,address,uint24)
const char* const SLOT0 = "0x3850c7bd";           // slot0()
const char* const LIQUIDITY = "0x1a686502";       // liquidity()
const char* const TICK_SPACING = "0xd0c93a7c";    // tickSpacing()
const char* const TOKEN0 = "0x0dfe1681";          // token0()
const char* const TOKEN1 = "0xd21220a7";          // token1()
const char* const FEE = "0xddca3f43";             // fee()
const char* const FEE_GROWTH0 = "0xf3058399";     // feeGrowthGlobal0X128()
const char* const FEE_GROWTH1 = "0x46141319";     // feeGrowthGlobal1X128()
const char* const DECIMALS = "0x313ce567";        // decimals()
const char* const SYMBOL = "0x95d89b41";          // symbol()
const char* const NAME = "0x06fdde03";            // name()

bool is_revert(const nlohmann::json& error) {
    std::string message = error.value("message", std::string());
    return util::contains_ci(message, "revert") || error.value("code", 0) == 3;
}

} // namespace

std::optional<std::string> ChainRpcClient::factory_address(int64_t chain_id) {
    switch (chain_id) {
        case 1:
        case 10:
        case 137:
        case 42161:
            return std::string("0x1f98431c8ad98523631ae4a59f267346ea31f984");
        case 8453:
            return std::string("0x33128a8fc17869897dce68ed026d694621f6fdfd");
        case 56:
            return std::string("0xdb1d10011ad0ff90774d0c6bb92e5c5c8b4461f7");
        default:
            return std::nullopt;
    }
}

class ChainRpcClient::Impl {
public:
    Impl(std::map<int64_t, std::string> rpc_urls, int64_t timeout_ms)
        : rpc_urls_(std::move(rpc_urls)), timeout_ms_(timeout_ms) {}

    std::optional<PoolRecord> get_pool_on_chain(const std::string& token_a, const std::string& token_b,
                                                FeeTier fee, int64_t chain_id) {
        auto factory = factory_address(chain_id);
        if (!factory) {
            throw UpstreamException(ErrorKind::UpstreamError,
                                    fmt::format("No Uniswap V3 factory known for chain {}", chain_id), false);
        }

        auto pair = canonical_pair(token_a, token_b);
        auto data = abi::call_data(GET_POOL,
            abi::encode_address(pair.first) +
            abi::encode_address(pair.second) +
            abi::encode_uint(static_cast<uint64_t>(fee_tier_value(fee))));

        auto result = eth_call(chain_id, *factory, data);
        if (!result) {
            return std::nullopt;
        }

        auto pool_address = abi::decode_address(abi::word(*result, 0));
        if (abi::is_zero_address(pool_address)) {
            spdlog::debug("Factory on chain {} has no pool for {}/{} fee {}",
                          chain_id, pair.first, pair.second, fee_tier_value(fee));
            return std::nullopt;
        }

        return read_pool(pool_address, chain_id, pair.first, pair.second, fee);
    }

    std::optional<PoolRecord> get_pool_at(const std::string& address, int64_t chain_id) {
        auto token0 = eth_call(chain_id, address, abi::call_data(TOKEN0));
        if (!token0) {
            return std::nullopt;
        }
        auto token1 = eth_call(chain_id, address, abi::call_data(TOKEN1));
        auto fee_word = eth_call(chain_id, address, abi::call_data(FEE));
        if (!token1 || !fee_word) {
            return std::nullopt;
        }

        auto fee = fee_tier_from_int(static_cast<int64_t>(abi::decode_uint64(abi::word(*fee_word, 0))));
        if (!fee) {
            spdlog::debug("Contract {} on chain {} reports an unsupported fee tier", address, chain_id);
            return std::nullopt;
        }

        return read_pool(util::to_lower(address), chain_id,
                         abi::decode_address(abi::word(*token0, 0)),
                         abi::decode_address(abi::word(*token1, 0)),
                         *fee);
    }

    bool supports_chain(int64_t chain_id) const {
        return rpc_urls_.count(chain_id) > 0 && factory_address(chain_id).has_value();
    }

private:
    PoolRecord read_pool(const std::string& pool_address, int64_t chain_id,
                         const std::string& token0, const std::string& token1, FeeTier fee) {
        PoolRecord record;
        record.address = util::to_lower(pool_address);
        record.chain_id = chain_id;
        record.fee_tier = fee;
        record.token_a = read_token(chain_id, token0);
        record.token_b = read_token(chain_id, token1);

        auto slot0 = require_call(chain_id, record.address, SLOT0, "slot0");
        record.sqrt_price_x96 = abi::hex_to_decimal(abi::word(slot0, 0));
        record.tick = abi::decode_int24(abi::word(slot0, 1));

        auto liquidity = require_call(chain_id, record.address, LIQUIDITY, "liquidity");
        record.liquidity = abi::hex_to_decimal(abi::word(liquidity, 0));

        auto spacing = require_call(chain_id, record.address, TICK_SPACING, "tickSpacing");
        record.tick_spacing = abi::decode_int24(abi::word(spacing, 0));

        auto growth0 = require_call(chain_id, record.address, FEE_GROWTH0, "feeGrowthGlobal0X128");
        auto growth1 = require_call(chain_id, record.address, FEE_GROWTH1, "feeGrowthGlobal1X128");
        record.fee_growth_global_a_x128 = abi::hex_to_decimal(abi::word(growth0, 0));
        record.fee_growth_global_b_x128 = abi::hex_to_decimal(abi::word(growth1, 0));

        record.created_at_timestamp = "0";
        record.created_at_block = "0";
        record.volume_usd = "0";
        record.total_value_locked_usd = "0";
        record.total_value_locked_token_a = "0";
        record.total_value_locked_token_b = "0";
        record.fees_usd = "0";

        canonicalize(record);
        spdlog::info("Read pool {} on chain {} directly ({}/{})",
                     record.address, chain_id, record.token_a.symbol, record.token_b.symbol);
        return record;
    }

    // Metadata is optional on ERC-20; missing calls keep the defaults
    TokenInfo read_token(int64_t chain_id, const std::string& address) {
        TokenInfo token;
        token.address = util::to_lower(address);

        try {
            if (auto decimals = eth_call(chain_id, token.address, abi::call_data(DECIMALS))) {
                token.decimals = static_cast<int>(abi::decode_uint64(abi::word(*decimals, 0)));
            }
            if (auto symbol = eth_call(chain_id, token.address, abi::call_data(SYMBOL))) {
                token.symbol = abi::decode_string(*symbol);
            }
            if (auto name = eth_call(chain_id, token.address, abi::call_data(NAME))) {
                token.name = abi::decode_string(*name);
            }
        } catch (const UpstreamException&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::warn("Could not decode metadata for token {}: {}", token.address, e.what());
        }

        return token;
    }

    std::string require_call(int64_t chain_id, const std::string& to, const char* selector, const char* what) {
        auto result = eth_call(chain_id, to, abi::call_data(selector));
        if (!result) {
            throw UpstreamException(ErrorKind::UpstreamError,
                                    fmt::format("{}() reverted on pool {}", what, to), false);
        }
        return *result;
    }

    // Raw result hex; nullopt when the call reverted or hit an account without code
    std::optional<std::string> eth_call(int64_t chain_id, const std::string& to, const std::string& data) {
        auto it = rpc_urls_.find(chain_id);
        if (it == rpc_urls_.end()) {
            throw UpstreamException(ErrorKind::UpstreamError,
                                    fmt::format("No RPC endpoint for chain {}", chain_id), false);
        }

        nlohmann::json call = {{"to", abi::ensure_0x(to)}, {"data", data}};
        nlohmann::json params = nlohmann::json::array();
        params.push_back(call);
        params.push_back("latest");

        nlohmann::json payload = {
            {"jsonrpc", "2.0"},
            {"id", next_id_++},
            {"method", "eth_call"},
            {"params", params}
        };

        auto response = cpr::Post(
            cpr::Url{it->second},
            cpr::Body{payload.dump()},
            cpr::Header{{"Content-Type", "application/json"}},
            cpr::Timeout{static_cast<int32_t>(timeout_ms_)}
        );

        if (response.error) {
            if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
                throw UpstreamException(ErrorKind::UpstreamTimeout,
                                        fmt::format("RPC call timed out after {} ms", timeout_ms_));
            }
            throw UpstreamException(ErrorKind::UpstreamError, "RPC transport error: " + response.error.message);
        }
        if (response.status_code == 429) {
            throw UpstreamException(ErrorKind::RateLimited, "RPC rate limit hit (429)");
        }
        if (response.status_code != 200) {
            throw UpstreamException(ErrorKind::UpstreamError,
                                    fmt::format("RPC returned status {}", response.status_code));
        }

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(response.text);
        } catch (const nlohmann::json::parse_error& e) {
            throw UpstreamException(ErrorKind::UpstreamError, std::string("Invalid RPC response: ") + e.what(), false);
        }

        if (body.contains("error") && body["error"].is_object()) {
            if (is_revert(body["error"])) {
                return std::nullopt;
            }
            throw UpstreamException(ErrorKind::UpstreamError,
                                    "RPC error: " + body["error"].value("message", std::string("unknown")));
        }

        if (!body.contains("result") || !body["result"].is_string()) {
            throw UpstreamException(ErrorKind::UpstreamError, "RPC response without a result", false);
        }

        std::string result = body["result"].get<std::string>();
        if (abi::strip_0x(result).empty()) {
            return std::nullopt;
        }
        return result;
    }

    std::map<int64_t, std::string> rpc_urls_;
    int64_t timeout_ms_;
    std::atomic<int64_t> next_id_{1};
};

ChainRpcClient::ChainRpcClient(std::map<int64_t, std::string> rpc_urls, int64_t timeout_ms)
    : pImpl_(std::make_unique<Impl>(std::move(rpc_urls), timeout_ms)) {}

ChainRpcClient::ChainRpcClient(const Config& config)
    : ChainRpcClient(config.rpc_urls, config.request_timeout_ms) {}

ChainRpcClient::~ChainRpcClient() = default;

std::optional<PoolRecord> ChainRpcClient::get_pool_on_chain(const std::string& token_a, const std::string& token_b,
                                                            FeeTier fee, int64_t chain_id) {
    return pImpl_->get_pool_on_chain(token_a, token_b, fee, chain_id);
}

std::optional<PoolRecord> ChainRpcClient::get_pool_at(const std::string& address, int64_t chain_id) {
    return pImpl_->get_pool_at(address, chain_id);
}

bool ChainRpcClient::supports_chain(int64_t chain_id) const {
    return pImpl_->supports_chain(chain_id);
}
