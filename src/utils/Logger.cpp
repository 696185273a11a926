#include "Logger.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <fstream>

namespace TierCache {

std::mutex Logger::log_mutex;
LogLevel Logger::min_level_ = LogLevel::Info;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};
Logger::Sink Logger::sink_{};

static inline std::string TwoDigits(int v) {
    char buf[3];
    buf[0] = char('0' + (v / 10));
    buf[1] = char('0' + (v % 10));
    buf[2] = '\0';
    return std::string(buf, 2);
}

void Logger::Init(const std::string& base_dir, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = min_level;
    current_date_.clear();
    if (base_dir.empty()) {
        logs_dir_.clear();
        return;
    }
    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        std::cerr << "Could not create log directory " << logs_dir_.string() << ": " << ec.message() << std::endl;
        logs_dir_.clear();
    }
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = level;
}

LogLevel Logger::GetMinLevel() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level_;
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (t == "debug") return LogLevel::Debug;
    if (t == "info")  return LogLevel::Info;
    if (t == "warn" || t == "warning")  return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info:  return "Info";
        case LogLevel::Warn:  return "Warn";
        case LogLevel::Error: return "Error";
    }
    return "";
}

void Logger::SetSink(Sink sink) {
    std::lock_guard<std::mutex> lock(log_mutex);
    sink_ = std::move(sink);
}

void Logger::ResetSink() {
    std::lock_guard<std::mutex> lock(log_mutex);
    sink_ = nullptr;
}

static std::ofstream& GetFileStream() {
    static std::ofstream ofs;
    return ofs;
}

void Logger::OpenLogFileForDate(const std::string& date) {
    auto& ofs = GetFileStream();
    if (ofs.is_open()) ofs.close();
    std::filesystem::path file = logs_dir_ / (date + ".log");
    ofs.open(file, std::ios::out | std::ios::app);
}

void Logger::EnsureLogFileUnlocked(const std::tm& now_tm) {
    std::string date = std::to_string(1900 + now_tm.tm_year) + "-" + TwoDigits(now_tm.tm_mon + 1) + "-" + TwoDigits(now_tm.tm_mday);
    if (date != current_date_) {
        current_date_ = date;
        OpenLogFileForDate(date);
    }
}

void Logger::Log(LogLevel level, const std::string& message) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (level < min_level_) return;
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::tm buf;
        #ifdef _WIN32
        localtime_s(&buf, &in_time_t);
        #else
        localtime_r(&in_time_t, &buf);
        #endif

        const char* level_str = ToString(level);

        // Console
        auto& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
        out << std::put_time(&buf, "%Y-%m-%d %X") << " [" << level_str << "] " << message << std::endl;

        // File (logs/YYYY-MM-DD.log)
        if (!logs_dir_.empty()) {
            EnsureLogFileUnlocked(buf);
            auto& ofs = GetFileStream();
            if (ofs.is_open()) {
                ofs << std::put_time(&buf, "%Y-%m-%d %X") << " [" << level_str << "] " << message << std::endl;
            }
        }
        sink = sink_;
    }
    // Outside the lock so a sink may log or take its own locks.
    if (sink) sink(level, message);
}

}
