#include "pool_filters.hpp"
#include "util.hpp"
#include <algorithm>
#include <iterator>

namespace {

double order_value(const PoolRecord& record, PoolOrderBy order_by) {
    switch (order_by) {
        case PoolOrderBy::TotalValueLockedUsd: return util::safe_parse_double(record.total_value_locked_usd);
        case PoolOrderBy::VolumeUsd: return util::safe_parse_double(record.volume_usd);
        case PoolOrderBy::FeesUsd: return util::safe_parse_double(record.fees_usd);
        case PoolOrderBy::CreatedAtTimestamp: return util::safe_parse_double(record.created_at_timestamp);
    }
    return 0.0;
}

bool holds_token(const PoolRecord& record, const std::string& token_lower) {
    return util::to_lower(record.token_a.address) == token_lower ||
           util::to_lower(record.token_b.address) == token_lower;
}

} // namespace

std::vector<PoolRecord> filter_pools(std::vector<PoolRecord> records,
                                     const std::vector<FeeTier>& fee_tiers,
                                     std::optional<double> min_tvl_usd,
                                     std::optional<double> min_volume_usd) {
    records.erase(
        std::remove_if(records.begin(), records.end(),
            [&](const PoolRecord& pool) {
                if (!fee_tiers.empty() &&
                    std::find(fee_tiers.begin(), fee_tiers.end(), pool.fee_tier) == fee_tiers.end()) {
                    return true;
                }
                if (min_tvl_usd && util::safe_parse_double(pool.total_value_locked_usd) < *min_tvl_usd) {
                    return true;
                }
                if (min_volume_usd && util::safe_parse_double(pool.volume_usd) < *min_volume_usd) {
                    return true;
                }
                return false;
            }
        ),
        records.end()
    );
    return records;
}

void sort_pools(std::vector<PoolRecord>& records, PoolOrderBy order_by, OrderDirection direction) {
    std::stable_sort(records.begin(), records.end(),
        [order_by, direction](const PoolRecord& a, const PoolRecord& b) {
            double va = order_value(a, order_by);
            double vb = order_value(b, order_by);
            return direction == OrderDirection::Asc ? va < vb : va > vb;
        });
}

std::vector<PoolRecord> paginate(std::vector<PoolRecord> records, int first, int skip) {
    size_t start = static_cast<size_t>(std::max(skip, 0));
    if (start >= records.size()) {
        return {};
    }

    size_t count = static_cast<size_t>(std::max(first, 0));
    size_t end = std::min(records.size(), start + count);
    return std::vector<PoolRecord>(std::make_move_iterator(records.begin() + start),
                                   std::make_move_iterator(records.begin() + end));
}

std::vector<PoolRecord> match_symbol(const std::vector<PoolRecord>& records, const std::string& needle) {
    std::string term = util::trim(needle);
    std::vector<PoolRecord> matches;
    for (const auto& pool : records) {
        if (util::contains_ci(pool.token_a.symbol, term) || util::contains_ci(pool.token_b.symbol, term)) {
            matches.push_back(pool);
        }
    }
    return matches;
}

std::vector<PoolRecord> match_token(const std::vector<PoolRecord>& records, const std::string& token) {
    std::string token_lower = util::to_lower(token);
    std::vector<PoolRecord> matches;
    std::copy_if(records.begin(), records.end(), std::back_inserter(matches),
                 [&](const PoolRecord& pool) { return holds_token(pool, token_lower); });
    return matches;
}

std::vector<PoolRecord> apply_query(std::vector<PoolRecord> records, const PoolQuery& query) {
    if (query.token_a && query.token_b) {
        auto pair = canonical_pair(*query.token_a, *query.token_b);
        records.erase(
            std::remove_if(records.begin(), records.end(), [&](const PoolRecord& pool) {
                return canonical_pair(pool.token_a.address, pool.token_b.address) != pair;
            }),
            records.end());
    } else {
        std::vector<std::string> tokens;
        for (const auto& t : query.tokens) tokens.push_back(util::to_lower(t));
        if (query.token_a) tokens.push_back(util::to_lower(*query.token_a));
        if (query.token_b) tokens.push_back(util::to_lower(*query.token_b));

        if (!tokens.empty()) {
            records.erase(
                std::remove_if(records.begin(), records.end(), [&](const PoolRecord& pool) {
                    return std::none_of(tokens.begin(), tokens.end(),
                                        [&](const std::string& t) { return holds_token(pool, t); });
                }),
                records.end());
        }
    }

    records = filter_pools(std::move(records), query.fee_tiers, query.min_tvl_usd, query.min_volume_usd);
    sort_pools(records, query.order_by, query.order_direction);
    return paginate(std::move(records), query.first, query.skip);
}

std::vector<PoolRecord> apply_search_options(std::vector<PoolRecord> records, const SearchOptions& options) {
    records = filter_pools(std::move(records), options.fee_tiers, options.min_tvl_usd, options.min_volume_usd);
    if (options.limit >= 0 && records.size() > static_cast<size_t>(options.limit)) {
        records.resize(static_cast<size_t>(options.limit));
    }
    return records;
}
