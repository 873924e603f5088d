#pragma once
#include <cstdint>
#include <map>
#include <string>

class Config {
public:
    // Service info
    std::string service_name = "pool_resolver";
    std::string log_level = "info";

    // Cache settings
    int max_cache_size = 1000;
    int64_t default_ttl_ms = 300000;
    int64_t cleanup_interval_ms = 60000;

    // Upstream requests
    int64_t request_timeout_ms = 10000;
    int max_retries = 3;
    int64_t retry_base_delay_ms = 1000;
    int64_t retry_max_delay_ms = 30000;

    // Rate limiting
    int rate_limit_per_second = 10;
    int burst_limit = 50;  // worker threads for batch lookups

    // Persistence
    bool enable_persistence = false;
    std::string storage_key = "pool_resolver_cache";
    std::string persistence_backend = "file";  // file | redis
    std::string persistence_dir = "./data";

    // Redis
    std::string redis_host = "localhost";
    int redis_port = 6379;
    std::string redis_password;

    // Indexed ledger service, chain id -> GraphQL endpoint
    std::map<int64_t, std::string> subgraph_urls = default_subgraph_urls();
    std::string subgraph_api_key;

    // Direct chain reads, chain id -> JSON-RPC endpoint
    std::map<int64_t, std::string> rpc_urls = default_rpc_urls();

    // Resolution policy
    bool synthetic_fallback = true;
    int search_scan_size = 100;

    // HTTP API
    std::string http_host = "0.0.0.0";
    int http_port = 8090;

    static Config from_env();
    void validate() const;

    static std::map<int64_t, std::string> default_subgraph_urls();
    static std::map<int64_t, std::string> default_rpc_urls();

    // Parses "1=https://a,137=https://b"; throws std::runtime_error on a malformed entry
    static std::map<int64_t, std::string> parse_endpoint_map(const std::string& value);
};
