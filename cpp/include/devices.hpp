// include/devices.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "logger.hpp"
#include "types.hpp"

// ─── 거리 센서 ────────────────────────

// 샘플 공급원. poll() 이 nullopt 이면 이번 주기엔 샘플이 도착하지 않은 것 (gap)
class SampleSource {
public:
    virtual ~SampleSource() = default;
    virtual bool initialize() = 0;
    virtual bool enabled() const = 0;
    virtual std::optional<DistanceSample> poll(TimePoint now) = 0;
    virtual void close() = 0;
};

// VL53L1X ToF (lgpio I2C). initialize() 가 부팅 대기, 기본 설정 업로드,
// 거리 모드 설정까지 한다. 하나라도 실패하면 false
class Vl53l1xSensor : public SampleSource {
public:
    explicit Vl53l1xSensor(const SensorConfig& cfg);
    ~Vl53l1xSensor() override;

    bool initialize() override;
    bool enabled() const override { return enabled_; }
    std::optional<DistanceSample> poll(TimePoint now) override;
    void close() override;

private:
    bool write_regs(uint16_t reg, const uint8_t* data, int count);
    bool write_reg8(uint16_t reg, uint8_t value);
    bool write_reg16(uint16_t reg, uint16_t value);
    bool write_reg32(uint16_t reg, uint32_t value);
    bool read_regs(uint16_t reg, uint8_t* out, int count);

    bool wait_booted();
    bool data_ready(bool& ready);
    bool wait_data_ready();
    bool configure_distance_mode();
    void fail(const char* what);

    SensorConfig cfg_;
    int          handle_ = -1;
    bool         enabled_ = false;
    FailureStreak io_errors_{"ToFSensor", "Failed to read ToF sensor", "ToF sensor reads recovered"};
    uint8_t      ready_polarity_ = 1;
};

// ZeroMQ SUB 로 다른 프로세스가 밀어 주는 샘플 수신
//   메시지: {"distance_mm": 1234} 또는 {"distance_mm": null}
class ZmqSampleSource : public SampleSource {
public:
    explicit ZmqSampleSource(const SensorConfig& cfg);
    ~ZmqSampleSource() override;

    bool initialize() override;
    bool enabled() const override { return enabled_; }
    std::optional<DistanceSample> poll(TimePoint now) override;
    void close() override;

private:
    struct Impl;
    SensorConfig          cfg_;
    std::unique_ptr<Impl> impl_;
    bool                  enabled_ = false;
};

// JSON 메시지 한 개 → 샘플. 형식이 틀리면 nullopt
std::optional<DistanceSample> parse_sample_message(const std::string& payload, TimePoint now);

std::unique_ptr<SampleSource> make_sample_source(const SensorConfig& cfg);

// ─── 카메라 ────────────────────────

class Camera {
public:
    virtual ~Camera() = default;
    virtual bool initialize() = 0;
    // JPEG 바이트. 실패 시 nullopt
    virtual std::optional<std::vector<unsigned char>> capture() = 0;
    virtual void close() = 0;
};

// V4L2 카메라 (cv::VideoCapture) + JPEG 인코딩
class OpencvCamera : public Camera {
public:
    explicit OpencvCamera(const CameraConfig& cfg);
    ~OpencvCamera() override;

    bool initialize() override;
    std::optional<std::vector<unsigned char>> capture() override;
    void close() override;

private:
    struct Impl;
    CameraConfig          cfg_;
    std::unique_ptr<Impl> impl_;
};

// 시뮬레이션 모드: 파란 단색 640x480 JPEG
class DummyCamera : public Camera {
public:
    bool initialize() override { return true; }
    std::optional<std::vector<unsigned char>> capture() override;
    void close() override {}
};
