#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_int;
using util::get_env_bool;

std::map<int64_t, std::string> Config::default_subgraph_urls() {
    return {
        {1, "https://api.thegraph.com/subgraphs/name/uniswap/uniswap-v3"},
        {137, "https://api.thegraph.com/subgraphs/name/uniswap/uniswap-v3-polygon"},
        {42161, "https://api.thegraph.com/subgraphs/name/uniswap/uniswap-v3-arbitrum"},
        {10, "https://api.thegraph.com/subgraphs/name/uniswap/uniswap-v3-optimism"},
        {8453, "https://api.studio.thegraph.com/query/48211/uniswap-v3-base/version/latest"},
        {56, "https://api.thegraph.com/subgraphs/name/uniswap/uniswap-v3-bsc"}
    };
}

std::map<int64_t, std::string> Config::default_rpc_urls() {
    return {
        {1, "https://eth-mainnet.g.alchemy.com/v2/demo"},
        {137, "https://polygon-rpc.com"},
        {42161, "https://arb1.arbitrum.io/rpc"},
        {10, "https://mainnet.optimism.io"},
        {8453, "https://mainnet.base.org"},
        {56, "https://bsc-dataseed.binance.org"}
    };
}

std::map<int64_t, std::string> Config::parse_endpoint_map(const std::string& value) {
    std::map<int64_t, std::string> endpoints;

    for (const auto& entry : util::split_string(value, ',')) {
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Malformed endpoint entry '" + entry + "', expected chain=url");
        }

        auto chain_id = util::parse_int(util::trim(entry.substr(0, eq)));
        auto url = util::trim(entry.substr(eq + 1));
        if (!chain_id || *chain_id <= 0 || url.empty()) {
            throw std::runtime_error("Malformed endpoint entry '" + entry + "', expected chain=url");
        }

        endpoints[*chain_id] = url;
    }

    return endpoints;
}

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", "pool_resolver");
    config.log_level = get_env_var("LOG_LEVEL", "info");

    // Cache
    config.max_cache_size = static_cast<int>(get_env_int("MAX_CACHE_SIZE", 1000));
    config.default_ttl_ms = get_env_int("DEFAULT_TTL_MS", 300000);
    config.cleanup_interval_ms = get_env_int("CLEANUP_INTERVAL_MS", 60000);

    // Upstream
    config.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 10000);
    config.max_retries = static_cast<int>(get_env_int("MAX_RETRIES", 3));
    config.retry_base_delay_ms = get_env_int("RETRY_BASE_DELAY_MS", 1000);
    config.retry_max_delay_ms = get_env_int("RETRY_MAX_DELAY_MS", 30000);

    // Rate limiting
    config.rate_limit_per_second = static_cast<int>(get_env_int("RATE_LIMIT_PER_SECOND", 10));
    config.burst_limit = static_cast<int>(get_env_int("BURST_LIMIT", 50));

    // Persistence
    config.enable_persistence = get_env_bool("ENABLE_PERSISTENCE", false);
    config.storage_key = get_env_var("STORAGE_KEY", "pool_resolver_cache");
    config.persistence_backend = util::to_lower(get_env_var("PERSISTENCE_BACKEND", "file"));
    config.persistence_dir = get_env_var("PERSISTENCE_DIR", "./data");

    // Redis
    config.redis_host = get_env_var("REDIS_HOST", "localhost");
    config.redis_port = static_cast<int>(get_env_int("REDIS_PORT", 6379));
    config.redis_password = get_env_var("REDIS_PASSWORD");

    // Endpoints (chain=url, comma-separated); unset keeps the defaults
    std::string subgraph_urls = get_env_var("SUBGRAPH_URLS");
    if (!subgraph_urls.empty()) {
        config.subgraph_urls = parse_endpoint_map(subgraph_urls);
    }
    config.subgraph_api_key = get_env_var("SUBGRAPH_API_KEY");

    std::string rpc_urls = get_env_var("RPC_URLS");
    if (!rpc_urls.empty()) {
        config.rpc_urls = parse_endpoint_map(rpc_urls);
    }

    // Policy
    config.synthetic_fallback = get_env_bool("SYNTHETIC_FALLBACK", true);
    config.search_scan_size = static_cast<int>(get_env_int("SEARCH_SCAN_SIZE", 100));

    // HTTP
    config.http_host = get_env_var("HTTP_HOST", "0.0.0.0");
    config.http_port = static_cast<int>(get_env_int("HTTP_PORT", 8090));

    return config;
}

void Config::validate() const {
    if (max_cache_size < 1) {
        throw std::runtime_error("MAX_CACHE_SIZE must be at least 1");
    }

    if (default_ttl_ms <= 0) {
        throw std::runtime_error("DEFAULT_TTL_MS must be positive");
    }

    if (cleanup_interval_ms < 100) {
        throw std::runtime_error("CLEANUP_INTERVAL_MS must be at least 100 ms");
    }

    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }

    if (max_retries < 0 || max_retries > 10) {
        throw std::runtime_error("MAX_RETRIES must be between 0 and 10");
    }

    if (retry_base_delay_ms < 0 || retry_max_delay_ms < retry_base_delay_ms) {
        throw std::runtime_error("Retry delays must satisfy 0 <= RETRY_BASE_DELAY_MS <= RETRY_MAX_DELAY_MS");
    }

    if (rate_limit_per_second < 1) {
        throw std::runtime_error("RATE_LIMIT_PER_SECOND must be at least 1");
    }

    if (burst_limit < 1 || burst_limit > 256) {
        throw std::runtime_error("BURST_LIMIT must be between 1 and 256");
    }

    if (persistence_backend != "file" && persistence_backend != "redis") {
        throw std::runtime_error("PERSISTENCE_BACKEND must be 'file' or 'redis'");
    }

    if (enable_persistence && storage_key.empty()) {
        throw std::runtime_error("STORAGE_KEY is required when persistence is enabled");
    }

    if (subgraph_urls.empty()) {
        throw std::runtime_error("At least one subgraph endpoint is required");
    }

    if (search_scan_size < 1) {
        throw std::runtime_error("SEARCH_SCAN_SIZE must be at least 1");
    }

    if (http_port < 1 || http_port > 65535) {
        throw std::runtime_error("HTTP_PORT must be a valid port");
    }

    spdlog::info("Configuration validated successfully");
}
