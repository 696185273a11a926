#include "KeyUtil.hpp"
#include "../cache/CacheErrors.hpp"
#include <cstdint>
#include <cstring>
#include <algorithm>

namespace TierCache {
namespace KeyUtil {

std::string SchemaKey(const std::string& connection_id, const std::string& database) {
    return "schema:" + connection_id + ":" + database;
}

std::string SchemaKey(const std::string& connection_id, const std::string& database, const std::string& table) {
    return "schema:" + connection_id + ":" + database + ":" + table;
}

std::string QueryKey(const std::string& connection_id, const std::string& query_hash) {
    return "query:" + connection_id + ":" + query_hash;
}

std::string ExplainKey(const std::string& connection_id, const std::string& query_hash) {
    return "explain:" + connection_id + ":" + query_hash;
}

std::string DocsKey(const std::string& doc_id) {
    return "docs:" + doc_id;
}

static inline std::string ToBase36(uint64_t v) {
    static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(digits[v % 36]);
        v /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string HashQuery(const std::string& query) {
    // hash = hash * 31 + c, wrapped to a signed 32-bit value after every step
    uint32_t hash = 0;
    for (unsigned char c : query) {
        hash = (hash << 5) - hash + static_cast<uint32_t>(c);
    }
    int64_t signed_hash = static_cast<int32_t>(hash);
    uint64_t magnitude = static_cast<uint64_t>(signed_hash < 0 ? -signed_hash : signed_hash);
    return ToBase36(magnitude);
}

std::pair<std::string, std::string> SplitKey(const std::string& key) {
    auto pos = key.find(':');
    if (pos == std::string::npos) {
        throw InvalidKeyFormat(key);
    }
    return {key.substr(0, pos), key.substr(pos + 1)};
}

std::string EscapePattern(const std::string& text) {
    static const char* special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (std::strchr(special, c) != nullptr && c != '\0') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

}
}
