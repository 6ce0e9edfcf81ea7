// include/monitor.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "config.hpp"
#include "detector.hpp"
#include "devices.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include "uploader.hpp"

struct MonitorStats {
    uint64_t samples = 0;
    uint64_t missing_samples = 0;
    uint64_t invalid_samples = 0;
    uint64_t unknown_ticks = 0;     // 창 전체가 무효
    uint64_t events = 0;
    uint64_t instructions = 0;
    uint64_t capture_failures = 0;
};

// 한 주차면 처리 파이프라인 (샘플 → 필터 → 상태 → 스케줄러 → 카메라 → 큐)
// step() 은 한 스레드에서만 호출
class SpotMonitor {
public:
    SpotMonitor(const AppConfig& cfg, Camera& camera, TransmissionQueue& queue,
                ErrorReporter& reporter);

    // 센서 없이 fallback 주기 촬영
    void enable_fallback(TimePoint now);

    // sample 이 nullopt 면 이번 주기 샘플 누락
    void step(const std::optional<DistanceSample>& sample, TimePoint now);

    PresenceState state() const { return presence_.state(); }
    const CaptureScheduler& scheduler() const { return scheduler_; }
    const MonitorStats& stats() const { return stats_; }

    // 마지막 step() 에서 나온 이벤트/지시
    const std::optional<PresenceEvent>& last_event() const { return last_event_; }
    const std::vector<CaptureInstruction>& last_instructions() const { return last_instructions_; }

private:
    void handle(const std::vector<CaptureInstruction>& batch);

    DistanceFilter       filter_;
    PresenceStateMachine presence_;
    CaptureScheduler     scheduler_;
    Camera&              camera_;
    TransmissionQueue&   queue_;
    ErrorReporter&       reporter_;

    MonitorStats                    stats_;
    std::optional<PresenceEvent>    last_event_;
    std::vector<CaptureInstruction> last_instructions_;
    bool                            degraded_ = false;
};
