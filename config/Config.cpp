#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "utils/Logger.hpp"

namespace TierCache {

CacheConfig Config::TiersFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("\"tiers\" must be an object");
    }
    CacheConfig tiers;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& name = it.key();
        const nlohmann::json& value = it.value();
        if (!value.is_object()) {
            throw std::runtime_error("Tier '" + name + "' must be an object");
        }
        const long long max_size = value.value("max_size", 0LL);
        if (max_size <= 0) {
            throw std::runtime_error("Tier '" + name + "' needs a positive max_size");
        }
        TierConfig tier;
        tier.max_size = static_cast<size_t>(max_size);
        // null or missing default_ttl_ms: entries never expire
        if (value.contains("default_ttl_ms") && !value.at("default_ttl_ms").is_null()) {
            tier.default_ttl = Duration(value.at("default_ttl_ms").get<long long>());
        } else {
            tier.default_ttl = kNoExpiry;
        }
        tiers[name] = tier;
    }
    return tiers;
}

nlohmann::json Config::TiersToJson(const CacheConfig& tiers) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, tier] : tiers) {
        nlohmann::json t;
        t["max_size"] = tier.max_size;
        if (tier.default_ttl == kNoExpiry) {
            t["default_ttl_ms"] = nullptr;
        } else {
            t["default_ttl_ms"] = tier.default_ttl.count();
        }
        j[name] = t;
    }
    return j;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);

    Config defaults;
    log_level = data.value("log_level", defaults.log_level);
    log_dir = data.value("log_dir", defaults.log_dir);
    event_history_size = data.value("event_history_size", defaults.event_history_size);
    if (data.contains("tiers")) {
        tiers = TiersFromJson(data["tiers"]);
    } else {
        tiers = defaults.tiers;
    }

    // Write back missing keys so existing config.json reflects newly added options.
    // This is non-destructive: preserves unknown keys and only appends missing ones.
    bool changed = false;
    auto ensure_key = [&](const char* key, const nlohmann::json& value) {
        if (!data.contains(key)) { data[key] = value; changed = true; }
    };

    ensure_key("log_level", log_level);
    ensure_key("log_dir", log_dir);
    ensure_key("event_history_size", event_history_size);
    ensure_key("tiers", TiersToJson(tiers));

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            // Startup continues with the loaded values.
            Logger::Log(LogLevel::Warn, "Could not write upgraded config file: " + path);
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    nlohmann::json data;
    Config defaultConfig;
    data["log_level"] = defaultConfig.log_level;
    data["log_dir"] = defaultConfig.log_dir;
    data["event_history_size"] = defaultConfig.event_history_size;
    data["tiers"] = TiersToJson(defaultConfig.tiers);

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
