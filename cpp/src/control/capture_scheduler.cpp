// src/control/capture_scheduler.cpp

#include "scheduler.hpp"
#include "logger.hpp"

namespace {

double secs(std::chrono::milliseconds d) {
    return std::chrono::duration<double>(d).count();
}

// from 이후(now 포함 X) 첫 격자점: from + k*step > now
TimePoint next_grid_after(TimePoint from, std::chrono::milliseconds step, TimePoint now) {
    if (now < from) return from;
    auto behind = std::chrono::duration_cast<std::chrono::milliseconds>(now - from);
    return from + step * (behind / step + 1);
}

} // namespace

CaptureScheduler::CaptureScheduler(const DeviceConfig& device, const TriggerConfig& triggers)
    : device_(device), triggers_(triggers) {}

std::vector<CaptureInstruction> CaptureScheduler::on_event(const PresenceEvent& ev) {
    std::vector<CaptureInstruction> out;
    const TimePoint t = ev.timestamp;

    if (ev.kind == PresenceEventKind::Enter) {
        present_ = true;
        if (triggers_.periodic_enabled) verify_next_ = t + triggers_.periodic_period;
        else verify_next_.reset();

        // ENTER 가 항상 우선: 진행 중인 burst/검증 창은 버린다
        if (active_) {
            Log(LogLevel::Info, "Scheduler") << "Cancelling active " << to_string(active_->reason)
                                             << " policy on new entry";
            active_.reset();
        }

        if (triggers_.entry_enabled) {
            active_ = ActivePolicy{CaptureReason::EntryBurst, t + triggers_.entry_duration, t,
                                   triggers_.entry_interval};
            Log(LogLevel::Info, "Scheduler") << "Starting entry capture sequence: "
                                             << secs(triggers_.entry_duration) << "s @ "
                                             << secs(triggers_.entry_interval) << "s intervals";
            shoot_if_due(out, t);
            retire_if_elapsed(t);
        }
        return out;
    }

    // EXIT
    present_ = false;
    verify_next_.reset();
    if (active_) {
        Log(LogLevel::Info, "Scheduler") << "Vehicle left, cancelling " << to_string(active_->reason)
                                         << " policy";
        active_.reset();
    }
    if (triggers_.exit_enabled && triggers_.exit_send_immediate)
        emit(out, CaptureReason::ExitConfirm, t);
    return out;
}

std::vector<CaptureInstruction> CaptureScheduler::tick(TimePoint now) {
    std::vector<CaptureInstruction> out;

    retire_if_elapsed(now);

    if (fallback_next_ && now >= *fallback_next_) {
        emit(out, CaptureReason::Fallback, now);
        fallback_next_ = next_grid_after(*fallback_next_, triggers_.fallback_interval, now);
    }

    if (present_) arm_verify_if_due(now);

    shoot_if_due(out, now);
    retire_if_elapsed(now);
    return out;
}

void CaptureScheduler::enable_fallback(TimePoint now) {
    if (!triggers_.fallback_enabled) {
        Log(LogLevel::Info, "Scheduler") << "Fallback periodic capture disabled";
        return;
    }
    fallback_next_ = now + triggers_.fallback_interval;
    Log(LogLevel::Info, "Scheduler") << "Fallback periodic capture enabled: every "
                                     << secs(triggers_.fallback_interval) << "s";
}

std::optional<TimePoint> CaptureScheduler::next_verify_at() const {
    if (!present_) return std::nullopt;
    return verify_next_;
}

void CaptureScheduler::emit(std::vector<CaptureInstruction>& out, CaptureReason reason,
                            TimePoint t) const {
    out.push_back(CaptureInstruction{reason, device_.spot_number, device_.station_id, t});
}

void CaptureScheduler::shoot_if_due(std::vector<CaptureInstruction>& out, TimePoint now) {
    if (!active_) return;
    auto& p = *active_;
    if (now >= p.deadline || now < p.next_shot) return;

    // 밀린 tick 이 있어도 한 장만
    emit(out, p.reason, now);
    p.next_shot = next_grid_after(p.next_shot, p.interval, now);
}

void CaptureScheduler::retire_if_elapsed(TimePoint now) {
    if (!active_ || now < active_->deadline) return;
    if (active_->reason == CaptureReason::EntryBurst)
        Log(LogLevel::Info, "Scheduler") << "Entry capture sequence complete";
    else
        Log(LogLevel::Info, "Scheduler") << "Verification check complete";
    active_.reset();
}

void CaptureScheduler::arm_verify_if_due(TimePoint now) {
    if (!verify_next_ || now < *verify_next_) return;

    const TimePoint slot = *verify_next_;
    advance_verify_slot(now);

    // entry burst (또는 이전 창) 진행 중이면 이번 회차는 건너뜀
    if (active_) {
        Log(LogLevel::Debug, "Scheduler") << "Verification slot skipped, "
                                          << to_string(active_->reason) << " still active";
        return;
    }

    const TimePoint window_end = slot + triggers_.periodic_duration;
    if (now >= window_end) {
        Log(LogLevel::Warn, "Scheduler") << "Verification window missed (scheduler stalled), skipping";
        return;
    }

    active_ = ActivePolicy{CaptureReason::PeriodicVerify, window_end, slot,
                           triggers_.periodic_interval};
    Log(LogLevel::Info, "Scheduler") << "Starting periodic verification check";
}

void CaptureScheduler::advance_verify_slot(TimePoint now) {
    verify_next_ = next_grid_after(*verify_next_, triggers_.periodic_period, now);
}
