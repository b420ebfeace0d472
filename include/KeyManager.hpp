#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <spdlog/spdlog.h>

namespace data_assistance {

// Round-robin pool of embedding API keys. A key that is rate limited more
// than twice is taken out of rotation.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool_;
    mutable std::shared_mutex pool_mutex_;
    size_t current_index_ = 0;

public:
    explicit KeyManager(const std::vector<std::string>& keys) {
        for (const auto& k : keys) {
            if (!k.empty()) key_pool_.push_back({k, true, 0});
        }
        if (key_pool_.empty()) {
            spdlog::warn("Embedding key pool is empty; remote embedding requests will be unauthenticated");
        } else {
            spdlog::info("Embedding key pool loaded: {} keys", key_pool_.size());
        }
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex_);
        size_t count = 0;
        for (const auto& k : key_pool_) {
            if (k.is_active) count++;
        }
        return count;
    }

    // Empty when no active key remains.
    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex_);
        for (size_t step = 0; step < key_pool_.size(); ++step) {
            const auto& candidate = key_pool_[(current_index_ + step) % key_pool_.size()];
            if (candidate.is_active) return candidate.key;
        }
        return "";
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex_);
        if (key_pool_.empty()) return;

        // Charge the key get_current_key() handed out, not a retired slot.
        for (size_t step = 0; step < key_pool_.size(); ++step) {
            if (key_pool_[current_index_ % key_pool_.size()].is_active) break;
            current_index_ = (current_index_ + 1) % key_pool_.size();
        }

        auto& current = key_pool_[current_index_ % key_pool_.size()];
        current.fail_count++;
        if (current.fail_count > 2 && current.is_active) {
            current.is_active = false;
            spdlog::warn("Embedding key #{} taken out of rotation", current_index_);
        }
        current_index_ = (current_index_ + 1) % key_pool_.size();
    }
};

} // namespace data_assistance
