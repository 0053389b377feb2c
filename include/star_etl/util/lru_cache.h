#pragma once

// Bounded LRU memo table backed by absl::flat_hash_map
// Owned by the component that memoizes; never shared between runs

#include <absl/container/flat_hash_map.h>
#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <stdexcept>
#include <utility>

namespace star_etl {

template <typename K, typename V>
class LRUCache {
public:
    explicit LRUCache(size_t capacity) : capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("LRUCache capacity must be greater than 0");
        }
    }

    // Returns the cached value and marks it most recently used
    std::optional<V> Get(const K& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }
        ++hits_;
        order_.splice(order_.begin(), order_, it->second.second);
        return it->second.first;
    }

    void Put(const K& key, V value) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.first = std::move(value);
            order_.splice(order_.begin(), order_, it->second.second);
            return;
        }

        if (entries_.size() >= capacity_) {
            entries_.erase(order_.back());
            order_.pop_back();
        }

        order_.push_front(key);
        entries_.emplace(key, std::make_pair(std::move(value), order_.begin()));
    }

    // Computes and stores the value on a miss
    template <typename Fn>
    V GetOrCompute(const K& key, Fn&& compute) {
        if (auto cached = Get(key); cached.has_value()) {
            return *std::move(cached);
        }
        V value = compute(key);
        Put(key, value);
        return value;
    }

    void Clear() {
        entries_.clear();
        order_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    size_t Size() const { return entries_.size(); }
    size_t Capacity() const { return capacity_; }
    uint64_t Hits() const { return hits_; }
    uint64_t Misses() const { return misses_; }

private:
    size_t capacity_;
    // MRU at front
    std::list<K> order_;
    absl::flat_hash_map<K, std::pair<V, typename std::list<K>::iterator>> entries_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace star_etl
