#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <ctime>
#include <filesystem>

namespace OwStats {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    class Logger {
    public:
        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static void SetConsoleEnabled(bool enabled);
        static LogLevel FromString(const std::string& s);
        static const char* ToString(LogLevel level);
        static void Log(LogLevel level, const std::string& message);

        // Most recent formatted lines (without timestamp), oldest first.
        static std::vector<std::string> RecentLines();
        static void ClearRecent();

    private:
        static constexpr size_t kMaxRecentLines = 512;

        static std::mutex log_mutex;
        static LogLevel min_level_;
        static bool console_enabled_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static std::deque<std::string> recent_;
        static void EnsureLogFileUnlocked(const std::tm& now_tm);
        static void OpenLogFileForDate(const std::string& date);
    };
}
