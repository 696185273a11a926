#pragma once
#include <any>
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <typeinfo>
#include <vector>
#include "CacheTypes.hpp"
#include "../interfaces/ITierStore.hpp"
#include "../interfaces/IEventBus.hpp"
#include "../utils/KeyUtil.hpp"
#include "../utils/Logger.hpp"

namespace TierCache {

// Routes "<tier>:<key>" composite keys to per-tier LRU stores, keeps global
// hit/miss counters and invalidates entries by key, by pattern, or in response
// to schema changes, connection removal and write queries seen on the bus.
//
// Unknown tiers degrade to a miss (or a no-op for Set) with a warning.
// Keys without a colon throw InvalidKeyFormat.
class CacheManager {
public:
    explicit CacheManager(CacheConfig config = DefaultCacheConfig(), IEventBus* event_bus = nullptr, NowFn now = SteadyNow);
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    void Init();
    void Dispose();

    template <typename T>
    std::optional<T> Get(const std::string& key);

    template <typename T>
    void Set(const std::string& key, T value, std::optional<Duration> ttl = std::nullopt);

    bool Has(const std::string& key);
    void Invalidate(const std::string& key);

    // Matched with regex_search against "<tier>:<key>" in every tier.
    size_t InvalidatePattern(const std::regex& pattern);
    // Throws PatternCompileFailure if the text does not compile.
    size_t InvalidatePattern(const std::string& pattern);

    size_t OnSchemaChanged(const std::string& connection_id, const std::optional<std::string>& schema = std::nullopt);
    size_t OnConnectionRemoved(const std::string& connection_id);

    void Clear();
    void ClearTier(const std::string& tier);

    CacheStats GetStats() const;
    // Each tier reports the global hit rate, not a per-tier one.
    std::map<std::string, TierStats> GetDetailedStats() const;
    uint64_t GetVersion() const;
    std::vector<std::string> GetTierNames() const;

    // True if the statement starts with INSERT, UPDATE, DELETE, ALTER, DROP,
    // TRUNCATE, CREATE or RENAME (case-insensitive, leading whitespace ignored).
    static bool IsWriteStatement(const std::string& sql);

private:
    using Store = ITierStore<std::any>;

    struct Tier {
        TierConfig config;
        std::unique_ptr<Store> store;
    };

    Tier* FindTier(const std::string& name);
    const Tier* FindTier(const std::string& name) const;
    void RecordHit(const std::string& key);
    void RecordMiss(const std::string& key);
    size_t InvalidateMatching(const std::regex& pattern, const std::string& description);
    void OnQueryExecuted(const QueryResult& result);
    void Unsubscribe();

    std::map<std::string, Tier> tiers_;
    IEventBus* event_bus_ = nullptr;
    IEventBus::Unsubscribe unsubscribe_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> version_{1};
};

template <typename T>
std::optional<T> CacheManager::Get(const std::string& key) {
    auto [tier_name, local_key] = KeyUtil::SplitKey(key);
    Tier* tier = FindTier(tier_name);
    if (!tier) {
        Logger::Log(LogLevel::Warn, "Cache not found: " + tier_name);
        misses_.fetch_add(1);
        return std::nullopt;
    }

    auto value = tier->store->Get(local_key);
    if (!value) {
        RecordMiss(key);
        return std::nullopt;
    }

    if (const T* typed = std::any_cast<T>(&*value)) {
        RecordHit(key);
        return *typed;
    }
    Logger::Log(LogLevel::Warn, "Cache type mismatch for " + key + ": stored " + value->type().name() +
        ", requested " + typeid(T).name());
    RecordMiss(key);
    return std::nullopt;
}

template <typename T>
void CacheManager::Set(const std::string& key, T value, std::optional<Duration> ttl) {
    auto [tier_name, local_key] = KeyUtil::SplitKey(key);
    Tier* tier = FindTier(tier_name);
    if (!tier) {
        Logger::Log(LogLevel::Warn, "Cache not found: " + tier_name);
        return;
    }
    tier->store->Set(local_key, std::any(std::move(value)), ttl);
    Logger::Log(LogLevel::Debug, "Cache set: " + key);
}

}
