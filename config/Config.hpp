#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "cache/CacheTypes.hpp"

namespace TierCache {
    struct Config {
        std::string log_level = "info";
        std::string log_dir = ""; // empty: console only
        size_t event_history_size = 100;
        CacheConfig tiers = DefaultCacheConfig();

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);

        CacheConfig ToCacheConfig() const { return tiers; }

        // {"<tier>": {"max_size": N, "default_ttl_ms": M | null}}
        static CacheConfig TiersFromJson(const nlohmann::json& j);
        static nlohmann::json TiersToJson(const CacheConfig& tiers);
    };
}
