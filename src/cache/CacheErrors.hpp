#pragma once
#include <stdexcept>
#include <string>

namespace TierCache {

// Composite key without the tier separator. Always a caller bug.
class InvalidKeyFormat : public std::invalid_argument {
public:
    explicit InvalidKeyFormat(const std::string& key)
        : std::invalid_argument("Invalid cache key format: " + key + ". Expected format: tier:key"), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Invalidation pattern text that is not a valid regular expression.
class PatternCompileFailure : public std::runtime_error {
public:
    PatternCompileFailure(const std::string& pattern, const std::string& reason)
        : std::runtime_error("Invalid invalidation pattern '" + pattern + "': " + reason), pattern_(pattern) {}

    const std::string& pattern() const { return pattern_; }

private:
    std::string pattern_;
};

}
