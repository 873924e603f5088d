#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Post-hoc filters over fetched pools. Aggregates are parsed from their
// decimal strings; unparseable values count as zero.

std::vector<PoolRecord> filter_pools(std::vector<PoolRecord> records,
                                     const std::vector<FeeTier>& fee_tiers,
                                     std::optional<double> min_tvl_usd,
                                     std::optional<double> min_volume_usd);

void sort_pools(std::vector<PoolRecord>& records, PoolOrderBy order_by, OrderDirection direction);

std::vector<PoolRecord> paginate(std::vector<PoolRecord> records, int first, int skip);

// Pools whose token symbols contain needle, case-insensitive
std::vector<PoolRecord> match_symbol(const std::vector<PoolRecord>& records, const std::string& needle);

// Pools holding token on either side
std::vector<PoolRecord> match_token(const std::vector<PoolRecord>& records, const std::string& token);

// Token, fee, threshold filters, then ordering and pagination
std::vector<PoolRecord> apply_query(std::vector<PoolRecord> records, const PoolQuery& query);

std::vector<PoolRecord> apply_search_options(std::vector<PoolRecord> records, const SearchOptions& options);
