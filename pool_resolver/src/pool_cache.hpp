#pragma once

#include "types.hpp"
#include "config.hpp"
#include "lookup_key.hpp"
#include "lru_store.hpp"
#include "snapshot_store.hpp"
#include "stop_signal.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct CacheEntry {
    PoolRecord record;
    int64_t stored_at_ms = 0;   // wall clock, survives persistence
    int64_t ttl_ms = 0;
    PoolSource source = PoolSource::IndexedService;
    std::string pair_key;       // alias pointing at this entry

    bool expired(int64_t now_ms) const { return now_ms > stored_at_ms + ttl_ms; }
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    size_t size = 0;
    double hit_rate = 0.0;
    size_t approx_memory_bytes = 0;
};

void to_json(nlohmann::json& j, const CacheStats& stats);

struct PoolCacheOptions {
    size_t max_size = 1000;
    int64_t default_ttl_ms = 300000;
    int64_t cleanup_interval_ms = 60000;
    bool enable_persistence = false;
    std::string storage_key = "pool_resolver_cache";

    static PoolCacheOptions from_config(const Config& config);
};

// TTL cache of pool records over an LRU store.
// A record lives under its address key; its pair key is an alias to it,
// so address and token lookups of one pool share a single entry.
class PoolCache {
public:
    using Clock = std::function<int64_t()>;

    explicit PoolCache(PoolCacheOptions options,
                       std::unique_ptr<SnapshotStore> store = nullptr,
                       std::shared_ptr<StopSignal> stop = nullptr,
                       Clock clock = nullptr);
    ~PoolCache();

    PoolCache(const PoolCache&) = delete;
    PoolCache& operator=(const PoolCache&) = delete;

    // Miss, expiry or dangling alias returns nullopt. Expiry also counts as an eviction.
    std::optional<PoolRecord> get(const LookupKey& key);

    // Inserts or overwrites. Synthetic records are refused.
    bool set(const PoolRecord& record,
             std::optional<int64_t> ttl_ms = std::nullopt,
             PoolSource source = PoolSource::IndexedService);

    // Present and unexpired; does not touch stats or recency
    bool has(const LookupKey& key) const;

    bool remove(const LookupKey& key);

    // Drops every entry and resets the counters
    void clear();

    void warm_up(const std::vector<PoolRecord>& records, PoolSource source = PoolSource::IndexedService);

    // Evicts every expired entry, returns how many were removed
    size_t sweep_expired();

    CacheStats stats() const;

    // Background sweeper; persists after each sweep when enabled
    void start();

    // Stops the sweeper and writes a final snapshot. Safe to call twice.
    void shutdown();

    // Snapshot I/O. Failures are logged and reported as false, never thrown.
    bool persist();
    bool restore();

    nlohmann::json snapshot() const;

private:
    using Store = LruStore<std::string, CacheEntry>;

    // Address key for a lookup, following the alias for pair keys
    std::optional<std::string> resolve_locked(const LookupKey& key) const;
    void drop_alias_locked(const CacheEntry& entry, const std::string& address_key);
    void insert_locked(const std::string& address_key, CacheEntry entry, bool count_eviction);
    nlohmann::json snapshot_locked() const;
    void sweeper_loop();

    PoolCacheOptions options_;
    std::unique_ptr<SnapshotStore> store_;
    std::shared_ptr<StopSignal> stop_;
    Clock clock_;

    mutable std::mutex mutex_;
    Store entries_;
    std::unordered_map<std::string, std::string> aliases_;  // pair key -> address key
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;

    std::thread sweeper_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};
};
