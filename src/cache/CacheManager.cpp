#include "CacheManager.hpp"
#include "CacheErrors.hpp"
#include "LruStore.hpp"

namespace TierCache {

CacheManager::CacheManager(CacheConfig config, IEventBus* event_bus, NowFn now)
    : event_bus_(event_bus) {
    for (auto& [name, tier_config] : config) {
        Tier tier;
        tier.config = tier_config;
        tier.store = std::make_unique<LruStore<std::any>>(tier_config.max_size, tier_config.default_ttl, now);
        tiers_.emplace(name, std::move(tier));
    }

    // Write queries invalidate the query tier of their connection.
    if (event_bus_) {
        unsubscribe_ = event_bus_->On(Events::kQueryExecuted, [this](const QueryResult& result) {
            OnQueryExecuted(result);
        });
    }
}

CacheManager::~CacheManager() {
    Unsubscribe();
}

void CacheManager::Init() {
    Logger::Log(LogLevel::Info, "Cache manager initialized with " + std::to_string(tiers_.size()) + " tiers");
}

void CacheManager::Dispose() {
    Clear();
    Unsubscribe();
    Logger::Log(LogLevel::Info, "Cache manager disposed");
}

void CacheManager::Unsubscribe() {
    if (unsubscribe_) {
        unsubscribe_();
        unsubscribe_ = nullptr;
    }
}

CacheManager::Tier* CacheManager::FindTier(const std::string& name) {
    auto it = tiers_.find(name);
    return it == tiers_.end() ? nullptr : &it->second;
}

const CacheManager::Tier* CacheManager::FindTier(const std::string& name) const {
    auto it = tiers_.find(name);
    return it == tiers_.end() ? nullptr : &it->second;
}

void CacheManager::RecordHit(const std::string& key) {
    hits_.fetch_add(1);
    Logger::Log(LogLevel::Debug, "Cache hit: " + key);
}

void CacheManager::RecordMiss(const std::string& key) {
    misses_.fetch_add(1);
    Logger::Log(LogLevel::Debug, "Cache miss: " + key);
}

bool CacheManager::Has(const std::string& key) {
    auto [tier_name, local_key] = KeyUtil::SplitKey(key);
    Tier* tier = FindTier(tier_name);
    if (!tier) {
        Logger::Log(LogLevel::Warn, "Cache not found: " + tier_name);
        misses_.fetch_add(1);
        return false;
    }
    return tier->store->Has(local_key);
}

void CacheManager::Invalidate(const std::string& key) {
    auto [tier_name, local_key] = KeyUtil::SplitKey(key);
    Tier* tier = FindTier(tier_name);
    if (!tier) {
        Logger::Log(LogLevel::Warn, "Cache not found: " + tier_name);
        misses_.fetch_add(1);
        return;
    }
    if (tier->store->Delete(local_key)) {
        Logger::Log(LogLevel::Debug, "Cache invalidated: " + key);
    }
}

size_t CacheManager::InvalidateMatching(const std::regex& pattern, const std::string& description) {
    size_t count = 0;
    for (auto& [name, tier] : tiers_) {
        for (const auto& local_key : tier.store->Keys()) {
            const std::string full_key = name + ":" + local_key;
            if (std::regex_search(full_key, pattern) && tier.store->Delete(local_key)) {
                ++count;
            }
        }
    }
    Logger::Log(LogLevel::Info, "Invalidated " + std::to_string(count) + " cache entries matching pattern: " + description);
    return count;
}

size_t CacheManager::InvalidatePattern(const std::regex& pattern) {
    return InvalidateMatching(pattern, "<regex>");
}

size_t CacheManager::InvalidatePattern(const std::string& pattern) {
    std::regex compiled;
    try {
        compiled = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw PatternCompileFailure(pattern, e.what());
    }
    return InvalidateMatching(compiled, pattern);
}

size_t CacheManager::OnSchemaChanged(const std::string& connection_id, const std::optional<std::string>& schema) {
    const std::string conn = KeyUtil::EscapePattern(connection_id);
    // The connection id ends at a ':' or the end of the key, so "c1" never
    // matches "c10". A schema name is a prefix: "db1" also drops "db1_archive".
    const std::string schema_pattern = (schema && !schema->empty())
        ? "^schema:" + conn + ":" + KeyUtil::EscapePattern(*schema)
        : "^schema:" + conn + "(:|$)";

    size_t count = InvalidatePattern(schema_pattern);

    // Query plans may reference any schema of the connection.
    count += InvalidatePattern("^(query|explain):" + conn + "(:|$)");

    Logger::Log(LogLevel::Info, "Invalidated caches for connection " + connection_id + " due to schema change");
    return count;
}

size_t CacheManager::OnConnectionRemoved(const std::string& connection_id) {
    size_t count = InvalidatePattern("^[^:]+:" + KeyUtil::EscapePattern(connection_id) + "(:|$)");
    Logger::Log(LogLevel::Info, "Invalidated all caches for removed connection " + connection_id);
    return count;
}

bool CacheManager::IsWriteStatement(const std::string& sql) {
    static const std::regex write_op(R"(^\s*(INSERT|UPDATE|DELETE|ALTER|DROP|TRUNCATE|CREATE|RENAME)\b)",
        std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(sql, write_op);
}

void CacheManager::OnQueryExecuted(const QueryResult& result) {
    if (!IsWriteStatement(result.query)) return;

    // Explain entries are left alone; only schema changes drop them.
    InvalidatePattern("^query:" + KeyUtil::EscapePattern(result.connection_id) + ":");
    Logger::Log(LogLevel::Debug, "Cache invalidated for write operation on connection: " + result.connection_id);
}

void CacheManager::Clear() {
    for (auto& [name, tier] : tiers_) {
        tier.store->Clear();
    }
    hits_.store(0);
    misses_.store(0);
    version_.fetch_add(1);
    Logger::Log(LogLevel::Info, "All caches cleared");
}

void CacheManager::ClearTier(const std::string& tier_name) {
    Tier* tier = FindTier(tier_name);
    if (!tier) return;
    tier->store->Clear();
    Logger::Log(LogLevel::Info, "Cleared cache tier: " + tier_name);
}

CacheStats CacheManager::GetStats() const {
    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    const uint64_t total = stats.hits + stats.misses;
    stats.hit_rate = total > 0 ? static_cast<double>(stats.hits) / static_cast<double>(total) : 0.0;
    return stats;
}

std::map<std::string, TierStats> CacheManager::GetDetailedStats() const {
    const double hit_rate = GetStats().hit_rate;
    std::map<std::string, TierStats> stats;
    for (const auto& [name, tier] : tiers_) {
        stats[name] = {tier.store->Size(), tier.config.max_size, hit_rate};
    }
    return stats;
}

uint64_t CacheManager::GetVersion() const {
    return version_.load();
}

std::vector<std::string> CacheManager::GetTierNames() const {
    std::vector<std::string> names;
    names.reserve(tiers_.size());
    for (const auto& [name, tier] : tiers_) {
        names.push_back(name);
    }
    return names;
}

}
