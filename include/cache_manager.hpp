#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <chrono>
#include <vector>
#include <string>

namespace data_assistance {

template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size, std::chrono::seconds ttl = std::chrono::seconds(300))
        : max_size_(max_size), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return std::nullopt;
        }

        if (std::chrono::steady_clock::now() > it->second.expiry_time) {
            cache_list_.erase(it->second.list_it);
            cache_map_.erase(it);
            return std::nullopt;
        }

        // Move to front (most recently used)
        cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_size_ == 0) return;

        auto expiry = std::chrono::steady_clock::now() + ttl_;

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second.value = value;
            it->second.expiry_time = expiry;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
            return;
        }

        if (cache_map_.size() >= max_size_) {
            // Evict LRU
            auto lru_key = cache_list_.back();
            cache_list_.pop_back();
            cache_map_.erase(lru_key);
        }

        cache_list_.push_front(key);
        cache_map_[key] = {value, cache_list_.begin(), expiry};
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_map_.clear();
        cache_list_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.size();
    }

private:
    struct CacheEntry {
        Value value;
        typename std::list<Key>::iterator list_it;
        std::chrono::steady_clock::time_point expiry_time;
    };

    size_t max_size_;
    std::chrono::seconds ttl_;
    std::list<Key> cache_list_;
    std::unordered_map<Key, CacheEntry> cache_map_;
    mutable std::mutex mutex_;
};

// Embeddings keyed by the exact text that was embedded.
class CacheManager {
public:
    explicit CacheManager(size_t embedding_capacity = 1000,
                          std::chrono::seconds embedding_ttl = std::chrono::seconds(3600))
        : embedding_cache_(embedding_capacity, embedding_ttl) {}

    std::optional<std::vector<float>> get_embedding(const std::string& text) {
        return embedding_cache_.get(text);
    }

    void set_embedding(const std::string& text, const std::vector<float>& embedding) {
        embedding_cache_.set(text, embedding);
    }

    size_t embedding_count() const { return embedding_cache_.size(); }

    void clear_all() {
        embedding_cache_.clear();
    }

private:
    LRUCache<std::string, std::vector<float>> embedding_cache_;
};

} // namespace data_assistance
