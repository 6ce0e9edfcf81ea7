// include/scheduler.hpp
#pragma once

#include <optional>
#include <vector>
#include "config.hpp"
#include "types.hpp"

// 현재 instruction 을 만들고 있는 정책 (ExitConfirm 은 단발이라 여기 없음)
struct ActivePolicy {
    CaptureReason reason;       // EntryBurst 또는 PeriodicVerify
    TimePoint     deadline;     // 이 시각 이후로는 촬영하지 않음
    TimePoint     next_shot;
    std::chrono::milliseconds interval;
};

// 이벤트와 시계 tick 을 받아 CaptureInstruction 을 만든다.
// 모든 판단은 절대 시각 기준이라 tick 이 밀려도 보상 촬영이 몰리지 않는다.
class CaptureScheduler {
public:
    CaptureScheduler(const DeviceConfig& device, const TriggerConfig& triggers);

    std::vector<CaptureInstruction> on_event(const PresenceEvent& ev);
    std::vector<CaptureInstruction> tick(TimePoint now);

    // 센서 없이 동작: fallback 주기 촬영 시작
    void enable_fallback(TimePoint now);
    bool fallback_active() const { return fallback_next_.has_value(); }

    const std::optional<ActivePolicy>& active() const { return active_; }
    bool present() const { return present_; }

    // 다음 검증 창이 열릴 예정 시각 (PRESENT 가 아니면 nullopt)
    std::optional<TimePoint> next_verify_at() const;

private:
    void emit(std::vector<CaptureInstruction>& out, CaptureReason reason, TimePoint t) const;
    void arm_verify_if_due(TimePoint now);
    void retire_if_elapsed(TimePoint now);
    void shoot_if_due(std::vector<CaptureInstruction>& out, TimePoint now);
    void advance_verify_slot(TimePoint now);

    DeviceConfig  device_;
    TriggerConfig triggers_;

    bool                        present_ = false;
    std::optional<TimePoint>    verify_next_;
    std::optional<ActivePolicy> active_;
    std::optional<TimePoint>    fallback_next_;
};
