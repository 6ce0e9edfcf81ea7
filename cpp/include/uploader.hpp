// include/uploader.hpp
#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include "config.hpp"
#include "types.hpp"

// 프레임 한 장 전송 결과
struct SendResult {
    bool        ok = false;
    int         status = 0;      // HTTP 상태 코드, I/O 에러면 0
    std::string error;
};

// 이미지 수신 측 (Orin). 한 프레임당 한 번 요청
class ImageSink {
public:
    virtual ~ImageSink() = default;
    virtual SendResult send(const OutboundFrame& frame) = 0;
};

// 드롭/촬영 실패/점유 이벤트 보고 경로
class ErrorReporter {
public:
    virtual ~ErrorReporter() = default;
    virtual void frame_dropped(const OutboundFrame& frame, const std::string& reason) = 0;
    virtual void capture_failed(const CaptureInstruction& ins) = 0;
    virtual void presence_changed(const PresenceEvent& ev) = 0;
};

// 로그만 남기는 기본 reporter
class LogReporter : public ErrorReporter {
public:
    void frame_dropped(const OutboundFrame& frame, const std::string& reason) override;
    void capture_failed(const CaptureInstruction& ins) override;
    void presence_changed(const PresenceEvent& ev) override;
};

struct QueueStats {
    uint64_t    enqueued = 0;
    uint64_t    delivered = 0;
    uint64_t    failed_attempts = 0;
    uint64_t    dropped = 0;     // 재시도 한도 초과
    uint64_t    evicted = 0;     // 큐가 가득 차서 밀려남
    std::size_t pending = 0;
};

// 캡처 경로를 막지 않는 전송 큐.
//   enqueue() 는 즉시 반환, 실제 I/O 는 worker 스레드 (또는 테스트에서 process_once())
//   큐 앞 프레임이 재시도 중이면 뒤 프레임도 기다린다 (enqueue 순서 보장)
class TransmissionQueue {
public:
    TransmissionQueue(ImageSink& sink, const QueueConfig& cfg, ErrorReporter& reporter,
                      uint32_t seed = std::random_device{}());
    ~TransmissionQueue();

    TransmissionQueue(const TransmissionQueue&) = delete;
    TransmissionQueue& operator=(const TransmissionQueue&) = delete;

    // 가득 차 있으면 가장 오래된 대기 프레임을 버리고 false
    bool enqueue(OutboundFrame frame);

    void start();
    void stop();

    // 앞 프레임의 재시도 시각이 되었으면 한 번 전송 시도. 시도했으면 true
    bool process_once(TimePoint now);

    // 앞 프레임의 다음 시도 시각
    std::optional<TimePoint> next_attempt_at() const;

    QueueStats stats() const;

    // n 번째 실패 후 대기 시간 (지터 제외)
    std::chrono::milliseconds base_backoff(int failures) const;

private:
    struct Entry {
        OutboundFrame frame;
        int           failures = 0;
        TimePoint     not_before{};
    };

    void worker_loop();
    std::chrono::milliseconds backoff_with_jitter(int failures);

    ImageSink&     sink_;
    QueueConfig    cfg_;
    ErrorReporter& reporter_;

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Entry>       pending_;
    QueueStats              stats_;
    uint64_t                next_seq_ = 0;
    std::mt19937            rng_;
    bool                    in_flight_ = false;
    bool                    evict_in_flight_ = false;

    bool        running_ = false;
    std::thread worker_;
};
