// src/upload/transmission_queue.cpp

#include "uploader.hpp"
#include "logger.hpp"
#include <algorithm>

// ----------------- 로그 reporter ----------------- //

void LogReporter::frame_dropped(const OutboundFrame& frame, const std::string& reason) {
    Log(LogLevel::Error, "Uploader") << "Dropped " << to_string(frame.reason) << " frame #"
                                     << frame.sequence << " (spot #" << frame.spot_number
                                     << "): " << reason;
}

void LogReporter::capture_failed(const CaptureInstruction& ins) {
    Log(LogLevel::Warn, "Camera") << "Failed to capture " << to_string(ins.reason) << " image";
}

void LogReporter::presence_changed(const PresenceEvent& ev) {
    Log(LogLevel::Debug, "Presence") << "Event " << to_string(ev.kind);
}

// ----------------- 전송 큐 ----------------- //

TransmissionQueue::TransmissionQueue(ImageSink& sink, const QueueConfig& cfg,
                                     ErrorReporter& reporter, uint32_t seed)
    : sink_(sink), cfg_(cfg), reporter_(reporter), rng_(seed) {
    if (cfg_.capacity < 1) throw ConfigError("queue_capacity must be >= 1");
}

TransmissionQueue::~TransmissionQueue() {
    stop();
}

bool TransmissionQueue::enqueue(OutboundFrame frame) {
    std::optional<OutboundFrame> evicted;
    bool full = false;
    {
        std::lock_guard<std::mutex> g(mu_);
        frame.sequence = next_seq_++;
        ++stats_.enqueued;

        std::size_t occupied = pending_.size() + (in_flight_ ? 1 : 0);
        if (occupied >= cfg_.capacity) {
            full = true;
            if (!pending_.empty()) {
                evicted = std::move(pending_.front().frame);
                pending_.pop_front();
                ++stats_.evicted;
            } else {
                // 용량 1 이고 전송 중인 프레임뿐: 이번 시도가 실패하면 재시도 없이 버린다
                evict_in_flight_ = true;
            }
        }
        pending_.push_back(Entry{std::move(frame), 0, TimePoint{}});
        stats_.pending = pending_.size();
    }
    cv_.notify_one();

    if (evicted) reporter_.frame_dropped(*evicted, "queue full, evicted oldest pending frame");
    return !full;
}

bool TransmissionQueue::process_once(TimePoint now) {
    Entry current;
    {
        std::lock_guard<std::mutex> g(mu_);
        if (in_flight_ || pending_.empty() || now < pending_.front().not_before) return false;
        current = std::move(pending_.front());
        pending_.pop_front();
        in_flight_ = true;
        evict_in_flight_ = false;
        stats_.pending = pending_.size();
    }

    SendResult res = sink_.send(current.frame);

    std::optional<std::string> drop_reason;
    {
        std::lock_guard<std::mutex> g(mu_);
        in_flight_ = false;

        if (res.ok) {
            ++stats_.delivered;
        } else {
            ++stats_.failed_attempts;
            ++current.failures;
            if (evict_in_flight_) {
                ++stats_.evicted;
                drop_reason = "queue full, evicted while retrying";
            } else if (current.failures > cfg_.max_retries) {
                ++stats_.dropped;
                drop_reason = "gave up after " + std::to_string(current.failures) + " attempts (" +
                              (res.error.empty() ? "HTTP " + std::to_string(res.status) : res.error) + ")";
            } else {
                current.not_before = now + backoff_with_jitter(current.failures);
                pending_.push_front(std::move(current));
            }
        }
        evict_in_flight_ = false;
        stats_.pending = pending_.size();
    }

    if (res.ok) {
        Log(LogLevel::Debug, "Uploader") << to_string(current.frame.reason) << " image sent (spot #"
                                         << current.frame.spot_number << ")";
    } else if (drop_reason) {
        reporter_.frame_dropped(current.frame, *drop_reason);
    } else {
        Log(LogLevel::Warn, "Uploader") << "Image send failed: "
                                        << (res.error.empty() ? "HTTP " + std::to_string(res.status)
                                                              : res.error)
                                        << ", will retry";
    }
    cv_.notify_all();
    return true;
}

std::optional<TimePoint> TransmissionQueue::next_attempt_at() const {
    std::lock_guard<std::mutex> g(mu_);
    if (pending_.empty()) return std::nullopt;
    return pending_.front().not_before;
}

QueueStats TransmissionQueue::stats() const {
    std::lock_guard<std::mutex> g(mu_);
    return stats_;
}

std::chrono::milliseconds TransmissionQueue::base_backoff(int failures) const {
    if (failures < 1) return std::chrono::milliseconds(0);
    auto delay = cfg_.backoff_initial;
    for (int i = 1; i < failures && delay < cfg_.backoff_max; ++i) delay *= 2;
    return std::min(delay, cfg_.backoff_max);
}

std::chrono::milliseconds TransmissionQueue::backoff_with_jitter(int failures) {
    auto base = base_backoff(failures);
    if (cfg_.jitter <= 0) return base;
    std::uniform_real_distribution<double> U(1.0 - cfg_.jitter, 1.0 + cfg_.jitter);
    return std::chrono::milliseconds(static_cast<long long>(base.count() * U(rng_)));
}

void TransmissionQueue::start() {
    std::lock_guard<std::mutex> g(mu_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&TransmissionQueue::worker_loop, this);
}

void TransmissionQueue::stop() {
    {
        std::lock_guard<std::mutex> g(mu_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    std::lock_guard<std::mutex> g(mu_);
    if (!pending_.empty())
        Log(LogLevel::Warn, "Uploader") << pending_.size() << " frame(s) not sent at shutdown";
}

void TransmissionQueue::worker_loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (running_) {
        if (pending_.empty()) {
            cv_.wait(lk, [this] { return !running_ || !pending_.empty(); });
            continue;
        }
        TimePoint due = pending_.front().not_before;
        if (SteadyClock::now() < due) {
            cv_.wait_until(lk, due);
            continue;
        }
        lk.unlock();
        process_once(SteadyClock::now());
        lk.lock();
    }
}
