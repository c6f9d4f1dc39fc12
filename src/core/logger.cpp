#include "logger.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <iostream>

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

void Logger::log(LogLevel level, const std::string& message) {
    // Built outside the lock; only the sinks are serialized.
    std::string line = "[" + currentTimestamp() + "] [" + levelToString(level) + "] [T"
                     + std::to_string(threadTag()) + "] " + message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }

    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
    if (console_) {
        std::cerr << line << std::endl;
    }
}

void Logger::debug(const std::string& message) { log(LogLevel::LVL_DEBUG, message); }
void Logger::info(const std::string& message)  { log(LogLevel::LVL_INFO, message); }
void Logger::warn(const std::string& message)  { log(LogLevel::LVL_WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::LVL_ERROR, message); }

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_DEBUG: return "DEBUG";
        case LogLevel::LVL_INFO:  return "INFO";
        case LogLevel::LVL_WARN:  return "WARN";
        case LogLevel::LVL_ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::currentTimestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t secs = system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(millis));
    return buf;
}

int Logger::threadTag() {
    static std::atomic<int> next{1};
    thread_local int tag = next++;
    return tag;
}
