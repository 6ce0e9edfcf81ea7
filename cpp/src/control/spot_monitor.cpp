// src/control/spot_monitor.cpp

#include "monitor.hpp"
#include "logger.hpp"

SpotMonitor::SpotMonitor(const AppConfig& cfg, Camera& camera, TransmissionQueue& queue,
                         ErrorReporter& reporter)
    : filter_(cfg.filter),
      presence_(cfg.thresholds),
      scheduler_(cfg.device, cfg.triggers),
      camera_(camera),
      queue_(queue),
      reporter_(reporter) {}

void SpotMonitor::enable_fallback(TimePoint now) {
    scheduler_.enable_fallback(now);
}

void SpotMonitor::step(const std::optional<DistanceSample>& sample, TimePoint now) {
    last_event_.reset();
    last_instructions_.clear();

    if (sample) {
        ++stats_.samples;
        if (!sample->valid()) ++stats_.invalid_samples;

        auto filtered = filter_.push(*sample);
        if (!filtered) {
            ++stats_.unknown_ticks;
            if (!degraded_) {
                degraded_ = true;
                Log(LogLevel::Warn, "Monitor") << "No valid distance in smoothing window, holding "
                                               << to_string(presence_.state()) << " (degraded confidence)";
            }
        } else if (degraded_) {
            degraded_ = false;
            Log(LogLevel::Info, "Monitor") << "Distance readings recovered (" << *filtered << "mm)";
        }

        auto ev = presence_.update(filtered, sample->timestamp);
        if (ev) {
            ++stats_.events;
            last_event_ = ev;
            reporter_.presence_changed(*ev);
            handle(scheduler_.on_event(*ev));
        }
    } else {
        // 이번 주기 샘플 없음: 창은 그대로, 상태 유지
        ++stats_.missing_samples;
    }

    handle(scheduler_.tick(now));
}

void SpotMonitor::handle(const std::vector<CaptureInstruction>& batch) {
    for (const auto& ins : batch) {
        ++stats_.instructions;
        last_instructions_.push_back(ins);

        auto image = camera_.capture();
        if (!image) {
            // 놓친 촬영은 재시도하지 않는다. 다음 예정 촬영은 그대로 진행
            ++stats_.capture_failures;
            reporter_.capture_failed(ins);
            continue;
        }

        OutboundFrame frame;
        frame.image       = std::move(*image);
        frame.station_id  = ins.station_id;
        frame.spot_number = ins.spot_number;
        frame.captured_at = std::chrono::system_clock::now();
        frame.reason      = ins.reason;
        queue_.enqueue(std::move(frame));
    }
}
