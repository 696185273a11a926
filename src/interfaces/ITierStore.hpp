#pragma once
#include <string>
#include <vector>
#include <optional>
#include "../cache/CacheTypes.hpp"

namespace TierCache {

template <typename T>
class ITierStore {
public:
    virtual ~ITierStore() = default;
    virtual std::optional<T> Get(const std::string& key) = 0;
    // ttl == std::nullopt selects the tier's default TTL.
    virtual void Set(const std::string& key, T value, std::optional<Duration> ttl = std::nullopt) = 0;
    virtual bool Has(const std::string& key) = 0;
    virtual bool Delete(const std::string& key) = 0;
    virtual void Clear() = 0;
    virtual size_t Size() const = 0;
    virtual std::vector<std::string> Keys() const = 0;
};

}
