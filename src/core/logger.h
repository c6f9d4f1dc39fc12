#pragma once
#include <fstream>
#include <mutex>
#include <string>

// NOTE: Avoid bare ERROR/DEBUG – they collide with common platform macros.
enum class LogLevel { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR };

/// Process-wide logger shared by the probe, the fetch workers and the CLI.
///
/// Line format: "[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [T<n>] message"
/// where T<n> is a small per-thread number assigned on first use, so lines
/// from concurrent chunk fetches can be told apart.
class Logger {
public:
    static Logger& instance();

    /// Lines below this level are dropped everywhere. Default: LVL_INFO.
    void setLevel(LogLevel level);

    /// Append to the given file, closing any previous one.
    /// An empty path only closes. Returns false if the file cannot be opened.
    bool setLogFile(const std::string& path);

    /// Echo lines to stderr. Off by default.
    void setConsoleOutput(bool enabled);

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    static const char* levelToString(LogLevel level);
    static std::string currentTimestamp();
    static int threadTag();

    std::mutex mutex_;
    LogLevel min_level_ = LogLevel::LVL_INFO;
    std::ofstream file_;
    bool console_ = false;
};
