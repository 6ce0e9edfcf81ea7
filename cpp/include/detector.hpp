// include/detector.hpp

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include "config.hpp"
#include "types.hpp"

// ─── 거리 평활화 ────────────────────────
//   최근 window 개 슬롯 중 유효 샘플만으로 평균(또는 중앙값)을 낸다.
//   무효 샘플도 슬롯을 차지하지만 0 으로 취급하지 않는다.
//   유효 샘플이 하나도 없으면 nullopt (= unknown, 분류하지 않음)
class DistanceFilter {
public:
    explicit DistanceFilter(const FilterConfig& cfg);

    std::optional<uint32_t> push(const DistanceSample& sample);

    // 마지막 push() 결과
    std::optional<uint32_t> current() const { return current_; }

    std::size_t valid_count() const;

private:
    std::optional<uint32_t> compute() const;

    FilterConfig               cfg_;
    std::deque<DistanceSample> window_;
    std::optional<uint32_t>    current_;
};

// ─── 차량 점유 상태 머신 ────────────────────────
//   ABSENT → PRESENT : filtered < vehicle_present_mm  (ENTER)
//   PRESENT → ABSENT : filtered > vehicle_absent_mm   (EXIT)
//   그 사이(히스테리시스 대역) 또는 unknown 이면 상태 유지
//   vehicle_present_mm >= vehicle_absent_mm 이면 ConfigError
class PresenceStateMachine {
public:
    explicit PresenceStateMachine(const ThresholdConfig& cfg);

    std::optional<PresenceEvent> update(std::optional<uint32_t> filtered_mm, TimePoint t);

    PresenceState state() const { return state_; }

private:
    ThresholdConfig cfg_;
    PresenceState   state_ = PresenceState::Absent;
};
