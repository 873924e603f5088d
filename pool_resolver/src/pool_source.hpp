#pragma once
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Indexed ledger service (a subgraph). nullopt means the service answered
// "no such pool"; transport and schema failures are thrown as UpstreamException.
class IndexedPoolSource {
public:
    virtual ~IndexedPoolSource() = default;

    virtual std::optional<PoolRecord> get_pool(const std::string& address, int64_t chain_id) = 0;
    virtual std::vector<PoolRecord> get_pools(int64_t chain_id, const PoolQuery& query) = 0;
    virtual std::optional<PoolRecord> get_pool_by_tokens(const std::string& token_a,
                                                         const std::string& token_b,
                                                         FeeTier fee, int64_t chain_id) = 0;
    virtual bool supports_chain(int64_t chain_id) const = 0;
};

// Direct contract reads, used only after the indexed service gave up
class ChainPoolSource {
public:
    virtual ~ChainPoolSource() = default;

    virtual std::optional<PoolRecord> get_pool_on_chain(const std::string& token_a,
                                                        const std::string& token_b,
                                                        FeeTier fee, int64_t chain_id) = 0;
    virtual std::optional<PoolRecord> get_pool_at(const std::string& address, int64_t chain_id) = 0;
    virtual bool supports_chain(int64_t chain_id) const = 0;
};
