/**
 * @file concurrent_map.hpp
 * @brief Lock-striped hash map for session registries
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Keys hash to one of a fixed number of shards, each with its own mutex, so
 * operations on different sessions rarely contend. No operation holds more
 * than one shard lock. Predicates run under the shard lock and must not
 * call back into the map.
 */

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ferry {

template <class Key, class Value, size_t ShardCount = 16, class Hash = std::hash<Key>>
class ShardedMap {
    static_assert(ShardCount > 0, "ShardedMap needs at least one shard");

public:
    ShardedMap() = default;

    ShardedMap(const ShardedMap&) = delete;
    ShardedMap& operator=(const ShardedMap&) = delete;

    /**
     * @brief Insert if the key is absent
     * @return true if inserted, false if the key already existed
     */
    bool insert(const Key& key, Value value) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.map.emplace(key, std::move(value)).second;
    }

    /**
     * @brief Insert or replace
     */
    void insert_or_assign(const Key& key, Value value) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.map.insert_or_assign(key, std::move(value));
    }

    /**
     * @brief Copy of the value for a key
     */
    std::optional<Value> find(const Key& key) const {
        const auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const Key& key) const {
        const auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.map.find(key) != shard.map.end();
    }

    /**
     * @brief Remove and return the value for a key
     */
    std::optional<Value> take(const Key& key) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return std::nullopt;
        }
        std::optional<Value> value(std::move(it->second));
        shard.map.erase(it);
        return value;
    }

    /**
     * @brief Remove the entry for a key only if the predicate accepts its value
     * @return The removed value
     */
    std::optional<Value> take_if(const Key& key, const std::function<bool(const Value&)>& predicate) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end() || !predicate(it->second)) {
            return std::nullopt;
        }
        std::optional<Value> value(std::move(it->second));
        shard.map.erase(it);
        return value;
    }

    bool erase(const Key& key) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.map.erase(key) > 0;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

    /**
     * @brief Copy out every entry, shard by shard
     *
     * Not an atomic snapshot of the whole map.
     */
    std::vector<std::pair<Key, Value>> entries() const {
        std::vector<std::pair<Key, Value>> result;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (const auto& kv : shard.map) {
                result.emplace_back(kv.first, kv.second);
            }
        }
        return result;
    }

    /**
     * @brief Remove and return every entry whose value matches the predicate
     */
    std::vector<std::pair<Key, Value>> take_matching(const std::function<bool(const Value&)>& predicate) {
        std::vector<std::pair<Key, Value>> removed;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto it = shard.map.begin(); it != shard.map.end();) {
                if (predicate(it->second)) {
                    removed.emplace_back(it->first, std::move(it->second));
                    it = shard.map.erase(it);
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<Key, Value, Hash> map;
    };

    Shard& shard_for(const Key& key) {
        return shards_[Hash{}(key) % ShardCount];
    }

    const Shard& shard_for(const Key& key) const {
        return shards_[Hash{}(key) % ShardCount];
    }

    std::array<Shard, ShardCount> shards_;
};

} // namespace ferry
