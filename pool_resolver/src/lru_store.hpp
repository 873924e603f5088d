#pragma once
#include <cstddef>
#include <list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

// Fixed-capacity key/value map with least-recently-used eviction.
// Not thread-safe; the owner serializes access.
template <typename Key, typename Value>
class LruStore {
public:
    using Entry = std::pair<Key, Value>;

    explicit LruStore(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("LruStore capacity must be positive");
        }
    }

    // Promotes the key to most recently used
    Value* get(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        order_.splice(order_.end(), order_, it->second);
        return &it->second->second;
    }

    // Lookup without touching recency
    const Value* peek(const Key& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        return &it->second->second;
    }

    bool has(const Key& key) const {
        return index_.find(key) != index_.end();
    }

    // Inserts or overwrites, marking the key most recently used.
    // Returns the entry evicted to make room, if any.
    std::optional<Entry> set(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.end(), order_, it->second);
            return std::nullopt;
        }

        std::optional<Entry> evicted;
        if (index_.size() >= capacity_) {
            evicted = std::move(order_.front());
            index_.erase(evicted->first);
            order_.pop_front();
        }

        order_.emplace_back(key, std::move(value));
        index_[key] = std::prev(order_.end());
        return evicted;
    }

    bool erase(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    // Removes every entry matching pred; returns the removed entries
    template <typename Predicate>
    std::vector<Entry> erase_if(Predicate pred) {
        std::vector<Entry> removed;
        for (auto it = order_.begin(); it != order_.end();) {
            if (pred(it->first, it->second)) {
                index_.erase(it->first);
                removed.push_back(std::move(*it));
                it = order_.erase(it);
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        order_.clear();
        index_.clear();
    }

    size_t size() const { return index_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return index_.empty(); }

    // Least recently used first
    typename std::list<Entry>::const_iterator begin() const { return order_.begin(); }
    typename std::list<Entry>::const_iterator end() const { return order_.end(); }

private:
    size_t capacity_;
    std::list<Entry> order_;
    std::unordered_map<Key, typename std::list<Entry>::iterator> index_;
};
