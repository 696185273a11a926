#pragma once
#include <string>
#include <optional>
#include <list>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <stdexcept>
#include "CacheTypes.hpp"
#include "../interfaces/ITierStore.hpp"

namespace TierCache {

// One tier: a bounded LRU map with per-entry TTL.
// Expiry is enforced lazily within Get/Has. No background sweep runs.
template <typename T>
class LruStore : public ITierStore<T> {
public:
    LruStore(size_t max_size, Duration default_ttl, NowFn now = SteadyNow)
        : max_size_(max_size), default_ttl_(default_ttl), now_(std::move(now)) {
        if (max_size_ == 0) {
            throw std::invalid_argument("LruStore max_size must be positive");
        }
        if (!now_) now_ = SteadyNow;
    }

    std::optional<T> Get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = FindLiveUnlocked(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second->value;
    }

    void Set(const std::string& key, T value, std::optional<Duration> ttl = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = now_();
        const Duration effective_ttl = ttl.value_or(default_ttl_);

        auto it = map_.find(key);
        if (it != map_.end()) {
            // Overwrite: no capacity check, just refresh and promote.
            it->second->value = std::move(value);
            it->second->stored_at = now;
            it->second->ttl = effective_ttl;
            list_.splice(list_.begin(), list_, it->second);
            return;
        }

        if (map_.size() >= max_size_ && !list_.empty()) {
            const auto& lru_entry = list_.back();
            map_.erase(lru_entry.key);
            list_.pop_back();
        }

        list_.push_front({key, std::move(value), now, effective_ttl});
        map_[key] = list_.begin();
    }

    // Same liveness and promotion rules as Get.
    bool Has(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return FindLiveUnlocked(key) != map_.end();
    }

    bool Delete(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return false;
        }
        list_.erase(it->second);
        map_.erase(it);
        return true;
    }

    void Clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        list_.clear();
        map_.clear();
    }

    size_t Size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    // Least- to most-recently used.
    std::vector<std::string> Keys() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> keys;
        keys.reserve(list_.size());
        for (auto it = list_.rbegin(); it != list_.rend(); ++it) {
            keys.push_back(it->key);
        }
        return keys;
    }

    size_t MaxSize() const { return max_size_; }
    Duration DefaultTtl() const { return default_ttl_; }

private:
    struct CacheEntry {
        std::string key;
        T value;
        Clock::time_point stored_at;
        Duration ttl;
    };

    using EntryList = std::list<CacheEntry>;
    using EntryMap = std::unordered_map<std::string, typename EntryList::iterator>;

    bool IsLive(const CacheEntry& entry, Clock::time_point now) const {
        // Compared in Duration units; converting a long TTL to clock ticks would overflow.
        return entry.ttl == kNoExpiry ||
            std::chrono::duration_cast<Duration>(now - entry.stored_at) < entry.ttl;
    }

    // Drops the entry if it has expired, otherwise moves it to the front.
    typename EntryMap::iterator FindLiveUnlocked(const std::string& key) {
        auto it = map_.find(key);
        if (it == map_.end()) {
            return it;
        }
        if (!IsLive(*it->second, now_())) {
            list_.erase(it->second);
            map_.erase(it);
            return map_.end();
        }
        list_.splice(list_.begin(), list_, it->second);
        return it;
    }

    size_t max_size_;
    Duration default_ttl_;
    NowFn now_;
    EntryList list_;
    EntryMap map_;
    mutable std::mutex mutex_;
};

}
