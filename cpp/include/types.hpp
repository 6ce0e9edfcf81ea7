// include/types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;
using WallTime    = std::chrono::system_clock::time_point;

// 센서 한 번 읽은 값. distance_mm 이 비어 있으면 무효 샘플
struct DistanceSample {
    TimePoint               timestamp;
    std::optional<uint32_t> distance_mm;

    bool valid() const { return distance_mm.has_value(); }
};

enum class PresenceState { Absent, Present };

enum class PresenceEventKind { Enter, Exit };

struct PresenceEvent {
    PresenceEventKind kind;
    TimePoint         timestamp;
};

// 촬영 이유 (정책 태그)
enum class CaptureReason { EntryBurst, ExitConfirm, PeriodicVerify, Fallback };

struct CaptureInstruction {
    CaptureReason reason;
    int           spot_number;
    std::string   station_id;
    TimePoint     timestamp;
};

struct OutboundFrame {
    std::vector<unsigned char> image;
    std::string   station_id;
    int           spot_number = 0;
    WallTime      captured_at;
    CaptureReason reason = CaptureReason::EntryBurst;
    uint64_t      sequence = 0;
};

const char* to_string(PresenceState s);
const char* to_string(PresenceEventKind k);
const char* to_string(CaptureReason r);

// "2025-07-16T11:45:30.123456" (로컬 시간)
std::string iso8601(WallTime t);
