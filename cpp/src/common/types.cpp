// src/common/types.cpp

#include "types.hpp"
#include <cstdio>
#include <ctime>

const char* to_string(PresenceState s) {
    return s == PresenceState::Present ? "PRESENT" : "ABSENT";
}

const char* to_string(PresenceEventKind k) {
    return k == PresenceEventKind::Enter ? "ENTER" : "EXIT";
}

const char* to_string(CaptureReason r) {
    switch (r) {
        case CaptureReason::EntryBurst:     return "entry";
        case CaptureReason::ExitConfirm:    return "exit";
        case CaptureReason::PeriodicVerify: return "verification";
        case CaptureReason::Fallback:       return "fallback";
    }
    return "capture";
}

std::string iso8601(WallTime t) {
    std::time_t t_c = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&t_c, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%T", &tm);

    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  t.time_since_epoch()).count() % 1000000;
    if (us < 0) us += 1000000;
    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(us));
    return std::string(buf) + frac;
}
