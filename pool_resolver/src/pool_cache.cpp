#include "pool_cache.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

void to_json(nlohmann::json& j, const CacheStats& stats) {
    j = nlohmann::json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"evictions", stats.evictions},
        {"size", stats.size},
        {"hit_rate", stats.hit_rate},
        {"approx_memory_bytes", stats.approx_memory_bytes}
    };
}

PoolCacheOptions PoolCacheOptions::from_config(const Config& config) {
    PoolCacheOptions options;
    options.max_size = static_cast<size_t>(config.max_cache_size);
    options.default_ttl_ms = config.default_ttl_ms;
    options.cleanup_interval_ms = config.cleanup_interval_ms;
    options.enable_persistence = config.enable_persistence;
    options.storage_key = config.storage_key;
    return options;
}

namespace {

size_t estimate_bytes(const TokenInfo& token) {
    return token.address.size() + token.symbol.size() + token.name.size();
}

size_t estimate_bytes(const std::string& key, const CacheEntry& entry) {
    const auto& r = entry.record;
    return sizeof(CacheEntry) + key.size() + entry.pair_key.size() +
           r.address.size() + estimate_bytes(r.token_a) + estimate_bytes(r.token_b) +
           r.sqrt_price_x96.size() + r.liquidity.size() +
           r.created_at_timestamp.size() + r.created_at_block.size() +
           r.volume_usd.size() + r.total_value_locked_usd.size() +
           r.total_value_locked_token_a.size() + r.total_value_locked_token_b.size() +
           r.fees_usd.size() + r.fee_growth_global_a_x128.size() + r.fee_growth_global_b_x128.size();
}

} // namespace

PoolCache::PoolCache(PoolCacheOptions options,
                     std::unique_ptr<SnapshotStore> store,
                     std::shared_ptr<StopSignal> stop,
                     Clock clock)
    : options_(std::move(options)),
      store_(std::move(store)),
      stop_(stop ? std::move(stop) : std::make_shared<StopSignal>()),
      clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms)),
      entries_(options_.max_size) {
    if (options_.enable_persistence) {
        if (store_) {
            restore();
        } else {
            spdlog::warn("Cache persistence enabled without a snapshot store; running in memory only");
        }
    }
}

PoolCache::~PoolCache() {
    shutdown();
}

std::optional<std::string> PoolCache::resolve_locked(const LookupKey& key) const {
    if (key.kind == LookupKey::Kind::Address) {
        return key.str();
    }

    auto it = aliases_.find(key.str());
    if (it == aliases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PoolCache::drop_alias_locked(const CacheEntry& entry, const std::string& address_key) {
    auto it = aliases_.find(entry.pair_key);
    if (it != aliases_.end() && it->second == address_key) {
        aliases_.erase(it);
    }
}

void PoolCache::insert_locked(const std::string& address_key, CacheEntry entry, bool count_eviction) {
    // An overwrite may move the pool to a different pair key
    if (const CacheEntry* existing = entries_.peek(address_key)) {
        if (existing->pair_key != entry.pair_key) {
            drop_alias_locked(*existing, address_key);
        }
    }

    std::string pair_key = entry.pair_key;
    auto evicted = entries_.set(address_key, std::move(entry));
    if (evicted) {
        drop_alias_locked(evicted->second, evicted->first);
        if (count_eviction) {
            evictions_++;
        }
        spdlog::debug("Evicted least recently used pool {}", evicted->first);
    }

    aliases_[pair_key] = address_key;
}

std::optional<PoolRecord> PoolCache::get(const LookupKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto address_key = resolve_locked(key);
    if (!address_key) {
        misses_++;
        return std::nullopt;
    }

    CacheEntry* entry = entries_.get(*address_key);
    if (!entry) {
        if (key.kind == LookupKey::Kind::Pair) {
            aliases_.erase(key.str());
        }
        misses_++;
        return std::nullopt;
    }

    if (entry->expired(clock_())) {
        drop_alias_locked(*entry, *address_key);
        entries_.erase(*address_key);
        misses_++;
        evictions_++;
        return std::nullopt;
    }

    hits_++;
    return entry->record;
}

bool PoolCache::set(const PoolRecord& record, std::optional<int64_t> ttl_ms, PoolSource source) {
    if (record.synthetic || source == PoolSource::Synthetic) {
        spdlog::warn("Refusing to cache synthetic pool record {}", record.address);
        return false;
    }

    if (record.address.empty()) {
        spdlog::warn("Refusing to cache pool record without an address");
        return false;
    }

    CacheEntry entry;
    entry.record = record;
    canonicalize(entry.record);
    entry.stored_at_ms = clock_();
    entry.ttl_ms = ttl_ms.value_or(options_.default_ttl_ms);
    entry.source = source;
    entry.pair_key = LookupKey::pair_of(entry.record).str();

    std::string address_key = LookupKey::for_record(entry.record).str();

    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(address_key, std::move(entry), true);
    return true;
}

bool PoolCache::has(const LookupKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto address_key = resolve_locked(key);
    if (!address_key) {
        return false;
    }

    const CacheEntry* entry = entries_.peek(*address_key);
    return entry && !entry->expired(clock_());
}

bool PoolCache::remove(const LookupKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto address_key = resolve_locked(key);
    if (!address_key) {
        return false;
    }

    const CacheEntry* entry = entries_.peek(*address_key);
    if (!entry) {
        return false;
    }

    drop_alias_locked(*entry, *address_key);
    return entries_.erase(*address_key);
}

void PoolCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    aliases_.clear();
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
}

void PoolCache::warm_up(const std::vector<PoolRecord>& records, PoolSource source) {
    size_t stored = 0;
    for (const auto& record : records) {
        if (set(record, std::nullopt, source)) {
            stored++;
        }
    }
    spdlog::info("Cache warmed with {}/{} pools", stored, records.size());
}

size_t PoolCache::sweep_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    const int64_t now = clock_();
    auto removed = entries_.erase_if([now](const std::string&, const CacheEntry& entry) {
        return entry.expired(now);
    });

    for (const auto& [address_key, entry] : removed) {
        drop_alias_locked(entry, address_key);
    }
    evictions_ += removed.size();

    if (!removed.empty()) {
        spdlog::debug("Swept {} expired pools, {} remain", removed.size(), entries_.size());
    }
    return removed.size();
}

CacheStats PoolCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.size = entries_.size();

    uint64_t lookups = hits_ + misses_;
    stats.hit_rate = lookups == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(lookups);

    size_t bytes = 0;
    for (const auto& [key, entry] : entries_) {
        bytes += estimate_bytes(key, entry);
    }
    for (const auto& [pair_key, address_key] : aliases_) {
        bytes += pair_key.size() + address_key.size();
    }
    stats.approx_memory_bytes = bytes;

    return stats;
}

void PoolCache::start() {
    if (running_.exchange(true)) {
        return;
    }

    sweeper_ = std::thread([this]() { sweeper_loop(); });
    spdlog::info("Cache sweeper started, interval {} ms", options_.cleanup_interval_ms);
}

void PoolCache::sweeper_loop() {
    const std::chrono::milliseconds interval(options_.cleanup_interval_ms);

    while (stop_->wait_for(interval)) {
        sweep_expired();
        if (options_.enable_persistence && store_) {
            persist();
        }
    }
}

void PoolCache::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }

    if (running_.exchange(false)) {
        stop_->request_stop();
        if (sweeper_.joinable()) {
            sweeper_.join();
        }
    }

    if (options_.enable_persistence && store_) {
        persist();
    }
}

nlohmann::json PoolCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

nlohmann::json PoolCache::snapshot_locked() const {
    const int64_t now = clock_();

    nlohmann::json cache = nlohmann::json::object();
    for (const auto& [key, entry] : entries_) {
        if (entry.expired(now)) {
            continue;
        }
        cache[key] = {
            {"record", entry.record},
            {"stored_at", entry.stored_at_ms},
            {"ttl", entry.ttl_ms},
            {"source", to_string(entry.source)}
        };
    }

    return {
        {"cache", cache},
        {"stats", {{"hits", hits_}, {"misses", misses_}, {"evictions", evictions_}}},
        {"timestamp", now}
    };
}

bool PoolCache::persist() {
    if (!store_) {
        return false;
    }

    try {
        std::string blob;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blob = snapshot_locked().dump();
        }

        store_->save(options_.storage_key, blob);
        spdlog::debug("Persisted cache snapshot to {}", store_->describe());
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to persist cache snapshot: {}", e.what());
        return false;
    }
}

bool PoolCache::restore() {
    if (!store_) {
        return false;
    }

    try {
        auto blob = store_->load(options_.storage_key);
        if (!blob) {
            spdlog::info("No cache snapshot found in {}", store_->describe());
            return false;
        }

        auto snapshot = nlohmann::json::parse(*blob);
        if (!snapshot.is_object() || !snapshot.contains("cache") || !snapshot["cache"].is_object()) {
            spdlog::warn("Ignoring cache snapshot with unexpected shape");
            return false;
        }

        const int64_t now = clock_();
        std::vector<std::pair<std::string, CacheEntry>> live;
        size_t dropped = 0;

        for (const auto& [key, item] : snapshot["cache"].items()) {
            CacheEntry entry;
            try {
                entry.record = item.at("record").get<PoolRecord>();
                entry.stored_at_ms = item.at("stored_at").get<int64_t>();
                entry.ttl_ms = item.at("ttl").get<int64_t>();
                entry.source = pool_source_from_string(item.value("source", "indexed-service"))
                                   .value_or(PoolSource::IndexedService);
            } catch (const std::exception& e) {
                spdlog::warn("Skipping unreadable snapshot entry {}: {}", key, e.what());
                dropped++;
                continue;
            }

            if (entry.record.synthetic || entry.expired(now)) {
                dropped++;
                continue;
            }

            canonicalize(entry.record);
            entry.pair_key = LookupKey::pair_of(entry.record).str();
            live.emplace_back(LookupKey::for_record(entry.record).str(), std::move(entry));
        }

        // Oldest first so recency order survives the reload
        std::sort(live.begin(), live.end(), [](const auto& a, const auto& b) {
            return a.second.stored_at_ms < b.second.stored_at_ms;
        });

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [address_key, entry] : live) {
            insert_locked(address_key, std::move(entry), false);
        }

        if (snapshot.contains("stats") && snapshot["stats"].is_object()) {
            const auto& saved = snapshot["stats"];
            hits_ = saved.value("hits", uint64_t{0});
            misses_ = saved.value("misses", uint64_t{0});
            evictions_ = saved.value("evictions", uint64_t{0});
        }

        spdlog::info("Restored {} pools from {} ({} expired or unreadable entries dropped)",
                     entries_.size(), store_->describe(), dropped);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to restore cache snapshot: {}", e.what());
        return false;
    }
}
