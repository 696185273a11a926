#pragma once
#include <string>
#include <utility>

namespace TierCache {
namespace KeyUtil {

// Canonical composite keys used by collaborators.
// schema:<conn>:<db>[:<table>], query:<conn>:<hash>, explain:<conn>:<hash>, docs:<id>
std::string SchemaKey(const std::string& connection_id, const std::string& database);
std::string SchemaKey(const std::string& connection_id, const std::string& database, const std::string& table);
std::string QueryKey(const std::string& connection_id, const std::string& query_hash);
std::string ExplainKey(const std::string& connection_id, const std::string& query_hash);
std::string DocsKey(const std::string& doc_id);

// Deterministic, order-sensitive 32-bit rolling hash rendered in base 36.
// Equal inputs always hash equal; collisions are possible.
std::string HashQuery(const std::string& query);

// Split "<tier>:<rest>" on the first colon. <rest> may contain further colons.
// Throws InvalidKeyFormat when there is no colon.
std::pair<std::string, std::string> SplitKey(const std::string& key);

// Escape every ECMAScript regex metacharacter so the text matches literally.
std::string EscapePattern(const std::string& text);

}
}
