#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace TierCache {

using Clock = std::chrono::steady_clock;
using NowFn = std::function<Clock::time_point()>;
using Duration = std::chrono::milliseconds;

// Entries stored with this TTL never expire.
constexpr Duration kNoExpiry = Duration::max();

inline Clock::time_point SteadyNow() {
    return Clock::now();
}

struct TierConfig {
    size_t max_size = 0;
    Duration default_ttl = kNoExpiry;
};

// Tier name -> configuration. Fixed for the lifetime of a CacheManager.
using CacheConfig = std::map<std::string, TierConfig>;

inline CacheConfig DefaultCacheConfig() {
    using namespace std::chrono;
    return {
        {"schema",  {100, duration_cast<Duration>(hours(1))}},
        {"query",   {50,  duration_cast<Duration>(minutes(5))}},
        {"explain", {50,  duration_cast<Duration>(minutes(10))}},
        {"docs",    {200, kNoExpiry}},
    };
}

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_rate = 0.0;
};

struct TierStats {
    size_t size = 0;
    size_t max_size = 0;
    double hit_rate = 0.0;
};

}
