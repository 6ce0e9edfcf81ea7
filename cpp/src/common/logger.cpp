// src/common/logger.cpp

#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>

namespace {

std::mutex            log_mutex;
std::ofstream         log_file;
std::atomic<int>      min_level{static_cast<int>(LogLevel::Info)};

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t_c, &tm);
    char buf[24];
    std::strftime(buf, sizeof(buf), "%F %T", &tm);
    return buf;
}

} // namespace

bool parse_log_level(const std::string& name, LogLevel& out) {
    static const std::map<std::string, LogLevel> levels = {
        {"DEBUG",   LogLevel::Debug},
        {"INFO",    LogLevel::Info},
        {"WARNING", LogLevel::Warn},
        {"WARN",    LogLevel::Warn},
        {"ERROR",   LogLevel::Error}
    };
    auto it = levels.find(name);
    if (it == levels.end()) return false;
    out = it->second;
    return true;
}

bool log_init(LogLevel level, const std::string& file) {
    min_level = static_cast<int>(level);

    std::lock_guard<std::mutex> g(log_mutex);
    if (log_file.is_open()) log_file.close();
    if (file.empty()) return true;

    log_file.open(file, std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << timestamp_now() << " [ERROR] Logger: cannot open log file " << file << "\n";
        return false;
    }
    return true;
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= min_level.load();
}

void log_write(LogLevel level, const std::string& tag, const std::string& msg) {
    std::string line = timestamp_now() + " [" + level_name(level) + "] " + tag + ": " + msg + "\n";

    std::lock_guard<std::mutex> g(log_mutex);
    std::cerr << line;
    if (log_file.is_open()) {
        log_file << line;
        log_file.flush();
    }
}

bool FailureStreak::failed() {
    if (failing_) return false;
    failing_ = true;
    Log(LogLevel::Warn, tag_) << failure_msg_;
    return true;
}

bool FailureStreak::succeeded() {
    if (!failing_) return false;
    failing_ = false;
    Log(LogLevel::Info, tag_) << recovery_msg_;
    return true;
}
