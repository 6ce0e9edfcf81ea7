// src/detect/parking_detector.cpp

#include "detector.hpp"
#include "logger.hpp"

PresenceStateMachine::PresenceStateMachine(const ThresholdConfig& cfg) : cfg_(cfg) {
    if (cfg_.vehicle_present_mm >= cfg_.vehicle_absent_mm)
        throw ConfigError("vehicle_present_mm must be < vehicle_absent_mm");
}

std::optional<PresenceEvent> PresenceStateMachine::update(std::optional<uint32_t> filtered_mm,
                                                          TimePoint t) {
    if (!filtered_mm) return std::nullopt;   // unknown → 상태 유지

    uint32_t d = *filtered_mm;

    if (state_ == PresenceState::Absent && d < cfg_.vehicle_present_mm) {
        state_ = PresenceState::Present;
        Log(LogLevel::Info, "Presence") << "Vehicle entry detected (distance: " << d << "mm)";
        return PresenceEvent{PresenceEventKind::Enter, t};
    }
    if (state_ == PresenceState::Present && d > cfg_.vehicle_absent_mm) {
        state_ = PresenceState::Absent;
        Log(LogLevel::Info, "Presence") << "Vehicle exit detected (distance: " << d << "mm)";
        return PresenceEvent{PresenceEventKind::Exit, t};
    }
    return std::nullopt;
}
