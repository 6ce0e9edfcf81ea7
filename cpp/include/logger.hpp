// include/logger.hpp
#pragma once

#include <sstream>
#include <string>
#include <utility>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// "DEBUG" / "INFO" / "WARNING" / "ERROR" → LogLevel. 모르는 값이면 false
bool parse_log_level(const std::string& name, LogLevel& out);

// 최소 레벨과 로그 파일 설정. file 이 비어 있으면 stderr 만 사용
// 파일을 열 수 없으면 false (stderr 로그는 계속 동작)
bool log_init(LogLevel min_level, const std::string& file = "");

void log_write(LogLevel level, const std::string& tag, const std::string& msg);

bool log_enabled(LogLevel level);

// 사용법: Log(LogLevel::Info, "Scheduler") << "entry burst armed";
// 소멸 시 한 줄로 출력
class Log {
public:
    Log(LogLevel level, const char* tag) : level_(level), tag_(tag) {}
    ~Log() {
        if (log_enabled(level_)) log_write(level_, tag_, buf_.str());
    }
    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    template <typename T>
    Log& operator<<(const T& v) {
        buf_ << v;
        return *this;
    }

private:
    LogLevel           level_;
    const char*        tag_;
    std::ostringstream buf_;
};

// 연속 실패는 처음 한 번(Warn)과 복구 시점(Info)에만 기록한다.
// failed()/succeeded() 는 이번 호출이 로그를 남겼으면 true
class FailureStreak {
public:
    FailureStreak(const char* tag, std::string failure_msg, std::string recovery_msg)
        : tag_(tag), failure_msg_(std::move(failure_msg)), recovery_msg_(std::move(recovery_msg)) {}

    bool failed();
    bool succeeded();
    void reset() { failing_ = false; }
    bool failing() const { return failing_; }

private:
    const char* tag_;
    std::string failure_msg_;
    std::string recovery_msg_;
    bool        failing_ = false;
};
