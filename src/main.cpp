#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>
#include "../config/Config.hpp"
#include "cache/CacheManager.hpp"
#include "cache/CacheErrors.hpp"
#include "events/EventBus.hpp"
#include "utils/Logger.hpp"

namespace {

std::vector<std::string> SplitWords(const std::string& line, size_t max_parts) {
    std::vector<std::string> parts;
    std::istringstream in(line);
    std::string word;
    while (parts.size() + 1 < max_parts && in >> word) {
        parts.push_back(word);
    }
    std::string rest;
    std::getline(in >> std::ws, rest);
    if (!rest.empty()) parts.push_back(rest);
    return parts;
}

void PrintHelp() {
    std::cout <<
        "Commands:\n"
        "  set <key> <value> [ttl_ms]   get <key>   has <key>   del <key>\n"
        "  pattern <regex>              schema <conn> [schema]  drop-conn <conn>\n"
        "  exec <conn> <sql...>         stats       tiers       clear\n"
        "  clear-tier <tier>            history [n] help        quit\n";
}

// Returns false when the loop should stop.
bool RunCommand(const std::string& line, TierCache::CacheManager& cache, TierCache::EventBus& bus) {
    auto head = SplitWords(line, 2);
    if (head.empty()) return true;
    const std::string& cmd = head[0];

    if (cmd == "quit" || cmd == "exit") return false;
    if (cmd == "help") { PrintHelp(); return true; }

    if (cmd == "set") {
        auto args = SplitWords(line, 4);
        if (args.size() < 3) { std::cout << "usage: set <key> <value> [ttl_ms]\n"; return true; }
        std::optional<TierCache::Duration> ttl;
        if (args.size() == 4) ttl = TierCache::Duration(std::stoll(args[3]));
        cache.Set<std::string>(args[1], args[2], ttl);
        std::cout << "OK\n";
    } else if (cmd == "get") {
        auto args = SplitWords(line, 2);
        if (args.size() < 2) { std::cout << "usage: get <key>\n"; return true; }
        auto value = cache.Get<std::string>(args[1]);
        std::cout << (value ? *value : std::string("(miss)")) << "\n";
    } else if (cmd == "has") {
        auto args = SplitWords(line, 2);
        if (args.size() < 2) { std::cout << "usage: has <key>\n"; return true; }
        std::cout << (cache.Has(args[1]) ? "true" : "false") << "\n";
    } else if (cmd == "del") {
        auto args = SplitWords(line, 2);
        if (args.size() < 2) { std::cout << "usage: del <key>\n"; return true; }
        cache.Invalidate(args[1]);
        std::cout << "OK\n";
    } else if (cmd == "pattern") {
        auto args = SplitWords(line, 2);
        if (args.size() < 2) { std::cout << "usage: pattern <regex>\n"; return true; }
        std::cout << cache.InvalidatePattern(args[1]) << " removed\n";
    } else if (cmd == "schema") {
        auto args = SplitWords(line, 3);
        if (args.size() < 2) { std::cout << "usage: schema <conn> [schema]\n"; return true; }
        std::optional<std::string> schema;
        if (args.size() == 3) schema = args[2];
        std::cout << cache.OnSchemaChanged(args[1], schema) << " removed\n";
    } else if (cmd == "drop-conn") {
        auto args = SplitWords(line, 2);
        if (args.size() < 2) { std::cout << "usage: drop-conn <conn>\n"; return true; }
        std::cout << cache.OnConnectionRemoved(args[1]) << " removed\n";
    } else if (cmd == "exec") {
        auto args = SplitWords(line, 3);
        if (args.size() < 3) { std::cout << "usage: exec <conn> <sql...>\n"; return true; }
        TierCache::QueryResult result;
        result.connection_id = args[1];
        result.query = args[2];
        bus.Emit(TierCache::Events::kQueryExecuted, result);
        std::cout << "OK\n";
    } else if (cmd == "stats") {
        auto stats = cache.GetStats();
        std::cout << "hits=" << stats.hits << " misses=" << stats.misses << " hit_rate=" << stats.hit_rate
                  << " version=" << cache.GetVersion() << "\n";
    } else if (cmd == "tiers") {
        for (const auto& [name, tier] : cache.GetDetailedStats()) {
            std::cout << name << ": " << tier.size << "/" << tier.max_size << " hit_rate=" << tier.hit_rate << "\n";
        }
    } else if (cmd == "clear") {
        cache.Clear();
        std::cout << "OK\n";
    } else if (cmd == "clear-tier") {
        auto args = SplitWords(line, 2);
        if (args.size() < 2) { std::cout << "usage: clear-tier <tier>\n"; return true; }
        cache.ClearTier(args[1]);
        std::cout << "OK\n";
    } else if (cmd == "history") {
        auto args = SplitWords(line, 2);
        std::optional<size_t> count;
        if (args.size() == 2) count = static_cast<size_t>(std::stoul(args[1]));
        for (const auto& event : bus.GetHistory(count)) {
            std::cout << "#" << event.id << " " << event.type << " (" << TierCache::ToString(event.priority) << ")\n";
        }
    } else {
        std::cout << "unknown command: " << cmd << " (try 'help')\n";
    }
    return true;
}

}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        TierCache::Logger::Log(TierCache::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else {
        config_path = std::filesystem::path(argv[0]).parent_path() / "config" / "config.json";
    }
    const std::string config_path_str = config_path.string();

    // Load Config
    try {
        TierCache::Config::GetInstance().Load(config_path_str);
        TierCache::Logger::Log(TierCache::LogLevel::Info, "Configuration loaded from: " + config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            TierCache::Logger::Log(TierCache::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                TierCache::Config::GetInstance().CreateDefault(config_path_str);
            } catch (const std::exception& create_e) {
                TierCache::Logger::Log(TierCache::LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
                return 1;
            }
        } else {
            TierCache::Logger::Log(TierCache::LogLevel::Error, "Failed to load config: " + error_message);
            return 1;
        }
    } catch (const nlohmann::json::exception& e) {
        TierCache::Logger::Log(TierCache::LogLevel::Error, "Failed to parse config: " + std::string(e.what()));
        return 1;
    }
    const auto& config = TierCache::Config::GetInstance();
    TierCache::Logger::Init(config.log_dir, TierCache::Logger::FromString(config.log_level));

    // Setup Core Components
    TierCache::EventBus event_bus(config.event_history_size);
    TierCache::CacheManager cache(config.ToCacheConfig(), &event_bus);
    cache.Init();

    PrintHelp();
    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        try {
            if (!RunCommand(line, cache, event_bus)) break;
        } catch (const TierCache::InvalidKeyFormat& e) {
            std::cout << "error: " << e.what() << "\n";
        } catch (const TierCache::PatternCompileFailure& e) {
            std::cout << "error: " << e.what() << "\n";
        } catch (const std::logic_error& e) {
            // std::stoll / std::stoul on malformed numbers
            std::cout << "error: " << e.what() << "\n";
        }
    }

    cache.Dispose();
    event_bus.Dispose();
    return 0;
}
