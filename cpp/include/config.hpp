// include/config.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

// 설정 파일 기본 경로
static const std::string DEFAULT_CONFIG_PATH = "config.json";

// MQTT 로 보내는 이벤트 코드
enum EventCode {
    CONNECTION_SUCCESS = -1,
    VEHICLE_ENTRY      = 0,
    VEHICLE_EXIT       = 1,
    FRAME_DROPPED      = 2,
    CAPTURE_FAILED     = 3
};

// 잘못된 설정 (시작 시 치명적)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class SmoothingMethod { Mean, Median };
enum class SampleSourceKind { I2c, Zmq };
enum class DistanceMode { Short, Long };

// short 모드에서 믿을 수 있는 최대 거리
constexpr uint32_t SHORT_MODE_MAX_MM = 1300;

// 초 단위 설정값 상한 (1일)
constexpr double MAX_DURATION_SECONDS = 86400.0;

struct DeviceConfig {
    std::string station_id = "station-1";
    int         spot_number = 1;
};

struct FilterConfig {
    std::size_t     window = 5;
    SmoothingMethod method = SmoothingMethod::Mean;
    std::chrono::milliseconds max_sample_age{0};   // 0 = 비활성
};

struct ThresholdConfig {
    uint32_t vehicle_present_mm = 1000;
    uint32_t vehicle_absent_mm  = 2000;
};

struct TriggerConfig {
    bool entry_enabled = true;
    std::chrono::milliseconds entry_duration{180000};
    std::chrono::milliseconds entry_interval{1000};

    bool exit_enabled        = true;
    bool exit_send_immediate = true;

    bool periodic_enabled = true;
    std::chrono::milliseconds periodic_period{300000};
    std::chrono::milliseconds periodic_duration{10000};
    std::chrono::milliseconds periodic_interval{1000};

    bool fallback_enabled = true;
    std::chrono::milliseconds fallback_interval{60000};
};

struct SensorConfig {
    bool             enabled = true;
    SampleSourceKind source = SampleSourceKind::I2c;
    int              i2c_bus = 1;
    int              i2c_address = 0x29;
    std::string      zmq_endpoint = "ipc:///tmp/tof_sensor.ipc";
    DistanceMode     distance_mode = DistanceMode::Short;
    double           frequency_hz = 5.0;
};

struct CameraConfig {
    int         device = 0;
    int         width = 1920;
    int         height = 1080;
    int         rotation = 0;
    int         brightness = 0;   // 퍼센트 오프셋
    int         quality = 90;
    std::string format = "jpeg";
};

struct SinkConfig {
    std::string protocol = "http";
    std::string ip_address = "192.168.1.100";
    int         port = 5000;
    std::string endpoint = "/receive_image";
    std::chrono::milliseconds timeout{10000};
    std::string ca_cert;
    std::string client_cert;
    std::string client_key;
};

struct QueueConfig {
    std::size_t capacity = 64;
    int         max_retries = 5;
    std::chrono::milliseconds backoff_initial{500};
    std::chrono::milliseconds backoff_max{30000};
    double      jitter = 0.2;
};

struct MqttConfig {
    bool        enabled = false;
    std::string host = "localhost";
    int         port = 1883;
    std::string topic = "alert";
    std::string client_id = "spotcam";
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
};

struct AppConfig {
    DeviceConfig    device;
    SensorConfig    sensor;
    FilterConfig    filter;
    ThresholdConfig thresholds;
    TriggerConfig   triggers;
    CameraConfig    camera;
    SinkConfig      sink;
    QueueConfig     queue;
    MqttConfig      mqtt;
    LoggingConfig   logging;
};

// JSON → AppConfig. 누락된 키는 기본값, 잘못된 값은 ConfigError
AppConfig parse_config(const nlohmann::json& root);

// 파일에서 읽고 parse_config() 적용
AppConfig load_config(const std::string& path);

// 히스테리시스 대역 등 일관성 검사. 실패 시 ConfigError
void validate_config(const AppConfig& cfg);

// "http://ip:port/endpoint"
std::string sink_url(const SinkConfig& sink);
