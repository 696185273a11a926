#pragma once
#include <string>
#include <mutex>
#include <ctime>
#include <functional>
#include <filesystem>

namespace TierCache {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static LogLevel GetMinLevel();
        static LogLevel FromString(const std::string& s);
        static const char* ToString(LogLevel level);
        static void Log(LogLevel level, const std::string& message);

        // Extra observer for every record that passes the level filter.
        static void SetSink(Sink sink);
        static void ResetSink();
    private:
        static std::mutex log_mutex;
        static LogLevel min_level_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static Sink sink_;
        static void EnsureLogFileUnlocked(const std::tm& now_tm);
        static void OpenLogFileForDate(const std::string& date);
    };
}
