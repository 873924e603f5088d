#include "lookup_key.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <stdexcept>

LookupKey LookupKey::for_address(const std::string& address, int64_t chain_id) {
    LookupKey key;
    key.kind = Kind::Address;
    key.chain_id = chain_id;
    key.address = util::to_lower(address);
    return key;
}

LookupKey LookupKey::for_pair(const std::string& token_a, const std::string& token_b,
                              FeeTier fee, int64_t chain_id) {
    auto ordered = canonical_pair(token_a, token_b);

    LookupKey key;
    key.kind = Kind::Pair;
    key.chain_id = chain_id;
    key.token_a = ordered.first;
    key.token_b = ordered.second;
    key.fee_tier = fee;
    return key;
}

LookupKey LookupKey::for_record(const PoolRecord& record) {
    return for_address(record.address, record.chain_id);
}

LookupKey LookupKey::pair_of(const PoolRecord& record) {
    return for_pair(record.token_a.address, record.token_b.address, record.fee_tier, record.chain_id);
}

std::string LookupKey::str() const {
    if (kind == Kind::Address) {
        return fmt::format("pool:{}:{}", chain_id, address);
    }
    return fmt::format("pair:{}:{}:{}:{}", chain_id, token_a, token_b, fee_tier_value(fee_tier));
}

PoolRequest PoolRequest::by_address(const std::string& address, int64_t chain_id) {
    PoolRequest request;
    request.kind = Kind::Address;
    request.address = address;
    request.chain_id = chain_id;
    return request;
}

PoolRequest PoolRequest::by_tokens(const std::string& token_a, const std::string& token_b,
                                   FeeTier fee, int64_t chain_id) {
    PoolRequest request;
    request.kind = Kind::Tokens;
    request.token_a = token_a;
    request.token_b = token_b;
    request.fee_tier = fee;
    request.chain_id = chain_id;
    return request;
}

std::string PoolRequest::describe() const {
    if (kind == Kind::Address) {
        return fmt::format("{} on chain {}", address, chain_id);
    }
    return fmt::format("{}/{} fee {} on chain {}", token_a, token_b, fee_tier_value(fee_tier), chain_id);
}

void from_json(const nlohmann::json& j, PoolRequest& request) {
    if (!j.is_object()) {
        throw std::invalid_argument("batch element must be an object");
    }

    int64_t chain_id = 1;
    if (j.contains("chain")) {
        if (!j["chain"].is_number_integer()) {
            throw std::invalid_argument("chain must be an integer");
        }
        chain_id = j["chain"].get<int64_t>();
    }

    if (j.contains("address")) {
        if (!j["address"].is_string()) {
            throw std::invalid_argument("address must be a string");
        }
        request = PoolRequest::by_address(j["address"].get<std::string>(), chain_id);
        return;
    }

    if (!j.contains("token_a") || !j.contains("token_b") ||
        !j["token_a"].is_string() || !j["token_b"].is_string()) {
        throw std::invalid_argument("expected address or token_a/token_b");
    }

    int64_t fee = 3000;
    if (j.contains("fee")) {
        if (!j["fee"].is_number_integer()) {
            throw std::invalid_argument("fee must be an integer");
        }
        fee = j["fee"].get<int64_t>();
    }
    auto tier = fee_tier_from_int(fee);
    if (!tier) {
        throw std::invalid_argument(fmt::format("unsupported fee tier {}", fee));
    }

    request = PoolRequest::by_tokens(j["token_a"].get<std::string>(), j["token_b"].get<std::string>(),
                                     *tier, chain_id);
}
