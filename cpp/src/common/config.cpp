// src/common/config.cpp

#include "config.hpp"
#include "logger.hpp"
#include <cmath>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// 초 단위 실수 → ms
std::chrono::milliseconds seconds_field(const json& obj, const char* key,
                                        std::chrono::milliseconds def) {
    if (!obj.contains(key)) return def;
    const auto& v = obj.at(key);
    if (!v.is_number())
        throw ConfigError(std::string("'") + key + "' must be a number of seconds");
    double s = v.get<double>();
    if (!std::isfinite(s) || s < 0 || s > MAX_DURATION_SECONDS)
        throw ConfigError(std::string("'") + key + "' must be between 0 and " +
                          std::to_string(static_cast<long long>(MAX_DURATION_SECONDS)) + " seconds");
    return std::chrono::milliseconds(static_cast<long long>(std::llround(s * 1000.0)));
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    if (!root.contains(key)) return empty;
    const auto& v = root.at(key);
    if (!v.is_object())
        throw ConfigError(std::string("section '") + key + "' must be an object");
    return v;
}

template <typename T>
T field(const json& obj, const char* key, T def) {
    if (!obj.contains(key)) return def;
    try {
        return obj.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad value for '") + key + "': " + e.what());
    }
}

} // namespace

AppConfig parse_config(const json& root) {
    if (!root.is_object()) throw ConfigError("config root must be an object");

    AppConfig cfg;

    const auto& dev = section(root, "device");
    cfg.device.station_id  = field<std::string>(dev, "station_id", cfg.device.station_id);
    cfg.device.spot_number = field<int>(dev, "spot_number", cfg.device.spot_number);

    // ---- ToF 센서 ----
    const auto& tof = section(root, "tof_sensor");
    cfg.sensor.enabled      = field<bool>(tof, "enabled", cfg.sensor.enabled);
    cfg.sensor.i2c_bus      = field<int>(tof, "i2c_bus", cfg.sensor.i2c_bus);
    cfg.sensor.i2c_address  = field<int>(tof, "i2c_address", cfg.sensor.i2c_address);
    cfg.sensor.zmq_endpoint = field<std::string>(tof, "zmq_endpoint", cfg.sensor.zmq_endpoint);

    std::string source = field<std::string>(tof, "source", "i2c");
    if (source == "i2c")      cfg.sensor.source = SampleSourceKind::I2c;
    else if (source == "zmq") cfg.sensor.source = SampleSourceKind::Zmq;
    else throw ConfigError("unknown tof_sensor.source '" + source + "'");

    std::string mode = field<std::string>(tof, "distance_mode", "short");
    if (mode == "short")     cfg.sensor.distance_mode = DistanceMode::Short;
    else if (mode == "long") cfg.sensor.distance_mode = DistanceMode::Long;
    else throw ConfigError("unknown tof_sensor.distance_mode '" + mode + "'");

    const auto& sampling = section(tof, "sampling");
    cfg.sensor.frequency_hz = field<double>(sampling, "frequency_hz", cfg.sensor.frequency_hz);
    int window = field<int>(sampling, "smoothing_window", static_cast<int>(cfg.filter.window));
    if (window < 1) throw ConfigError("smoothing_window must be >= 1");
    cfg.filter.window = static_cast<std::size_t>(window);
    cfg.filter.max_sample_age = std::chrono::milliseconds(
        field<long long>(sampling, "max_sample_age_ms", cfg.filter.max_sample_age.count()));

    static const std::map<std::string, SmoothingMethod> methods = {
        {"mean",   SmoothingMethod::Mean},
        {"median", SmoothingMethod::Median}
    };
    std::string method = field<std::string>(sampling, "smoothing_method", "mean");
    auto it = methods.find(method);
    if (it == methods.end()) throw ConfigError("unknown smoothing_method '" + method + "'");
    cfg.filter.method = it->second;

    const auto& th = section(tof, "thresholds");
    long long present = field<long long>(th, "vehicle_present_mm", cfg.thresholds.vehicle_present_mm);
    long long absent  = field<long long>(th, "vehicle_absent_mm", cfg.thresholds.vehicle_absent_mm);
    if (present < 0 || absent < 0 || present > UINT32_MAX || absent > UINT32_MAX)
        throw ConfigError("distance thresholds must be unsigned millimetres");
    cfg.thresholds.vehicle_present_mm = static_cast<uint32_t>(present);
    cfg.thresholds.vehicle_absent_mm  = static_cast<uint32_t>(absent);

    // ---- 트리거 ----
    const auto& triggers = section(tof, "triggers");
    auto& tr = cfg.triggers;

    const auto& entry = section(triggers, "entry_event");
    tr.entry_enabled  = field<bool>(entry, "enabled", tr.entry_enabled);
    tr.entry_duration = seconds_field(entry, "send_duration_seconds", tr.entry_duration);
    tr.entry_interval = seconds_field(entry, "send_interval_seconds", tr.entry_interval);

    const auto& exit_ev = section(triggers, "exit_event");
    tr.exit_enabled        = field<bool>(exit_ev, "enabled", tr.exit_enabled);
    tr.exit_send_immediate = field<bool>(exit_ev, "send_immediate", tr.exit_send_immediate);

    const auto& periodic = section(triggers, "periodic_check");
    tr.periodic_enabled  = field<bool>(periodic, "enabled", tr.periodic_enabled);
    tr.periodic_period   = seconds_field(periodic, "interval_seconds", tr.periodic_period);
    tr.periodic_duration = seconds_field(periodic, "send_duration_seconds", tr.periodic_duration);
    tr.periodic_interval = seconds_field(periodic, "send_interval_seconds", tr.periodic_interval);

    const auto& fallback = section(section(root, "fallback"), "periodic_capture");
    tr.fallback_enabled  = field<bool>(fallback, "enabled", tr.fallback_enabled);
    tr.fallback_interval = seconds_field(fallback, "interval_seconds", tr.fallback_interval);

    // ---- 카메라 ----
    const auto& cam = section(root, "camera");
    cfg.camera.device     = field<int>(cam, "device", cfg.camera.device);
    const auto& res = section(cam, "resolution");
    cfg.camera.width      = field<int>(res, "width", cfg.camera.width);
    cfg.camera.height     = field<int>(res, "height", cfg.camera.height);
    cfg.camera.rotation   = field<int>(cam, "rotation", cfg.camera.rotation);
    cfg.camera.brightness = field<int>(cam, "brightness", cfg.camera.brightness);
    cfg.camera.quality    = field<int>(cam, "quality", cfg.camera.quality);
    cfg.camera.format     = field<std::string>(cam, "format", cfg.camera.format);

    // ---- 수신 측 (NVIDIA Orin) ----
    const auto& nv = section(root, "nvidia");
    cfg.sink.protocol    = field<std::string>(nv, "protocol", cfg.sink.protocol);
    cfg.sink.ip_address  = field<std::string>(nv, "ip_address", cfg.sink.ip_address);
    cfg.sink.port        = field<int>(nv, "port", cfg.sink.port);
    cfg.sink.endpoint    = field<std::string>(nv, "endpoint", cfg.sink.endpoint);
    cfg.sink.timeout     = seconds_field(nv, "timeout_seconds", cfg.sink.timeout);
    cfg.sink.ca_cert     = field<std::string>(nv, "ca_cert", cfg.sink.ca_cert);
    cfg.sink.client_cert = field<std::string>(nv, "client_cert", cfg.sink.client_cert);
    cfg.sink.client_key  = field<std::string>(nv, "client_key", cfg.sink.client_key);

    const auto& tx = section(root, "transmission");
    int capacity = field<int>(tx, "queue_capacity", static_cast<int>(cfg.queue.capacity));
    if (capacity < 1) throw ConfigError("queue_capacity must be >= 1");
    cfg.queue.capacity    = static_cast<std::size_t>(capacity);
    cfg.queue.max_retries = field<int>(tx, "max_retries", cfg.queue.max_retries);
    cfg.queue.backoff_initial = std::chrono::milliseconds(
        field<long long>(tx, "backoff_initial_ms", cfg.queue.backoff_initial.count()));
    cfg.queue.backoff_max = std::chrono::milliseconds(
        field<long long>(tx, "backoff_max_ms", cfg.queue.backoff_max.count()));
    cfg.queue.jitter = field<double>(tx, "jitter", cfg.queue.jitter);

    const auto& mq = section(root, "mqtt");
    cfg.mqtt.enabled   = field<bool>(mq, "enabled", cfg.mqtt.enabled);
    cfg.mqtt.host      = field<std::string>(mq, "host", cfg.mqtt.host);
    cfg.mqtt.port      = field<int>(mq, "port", cfg.mqtt.port);
    cfg.mqtt.topic     = field<std::string>(mq, "topic", cfg.mqtt.topic);
    cfg.mqtt.client_id = field<std::string>(mq, "client_id", cfg.mqtt.client_id);

    const auto& lg = section(root, "logging");
    cfg.logging.level = field<std::string>(lg, "level", cfg.logging.level);
    cfg.logging.file  = field<std::string>(lg, "file", cfg.logging.file);

    validate_config(cfg);
    return cfg;
}

namespace {

void check_duration(std::chrono::milliseconds d, const char* name) {
    if (d.count() < 0 || d > std::chrono::milliseconds(static_cast<long long>(MAX_DURATION_SECONDS * 1000)))
        throw ConfigError(std::string(name) + " out of range");
}

} // namespace

void validate_config(const AppConfig& cfg) {
    const auto& th = cfg.thresholds;
    // 대역이 없으면 채터링 방지를 보장할 수 없다
    if (th.vehicle_present_mm >= th.vehicle_absent_mm)
        throw ConfigError("vehicle_present_mm (" + std::to_string(th.vehicle_present_mm) +
                          ") must be < vehicle_absent_mm (" +
                          std::to_string(th.vehicle_absent_mm) + ")");

    if (cfg.filter.window < 1) throw ConfigError("smoothing_window must be >= 1");
    if (cfg.filter.max_sample_age.count() < 0) throw ConfigError("max_sample_age_ms must be >= 0");
    if (!(cfg.sensor.frequency_hz > 0)) throw ConfigError("frequency_hz must be > 0");
    if (cfg.sink.timeout.count() <= 0) throw ConfigError("nvidia.timeout_seconds must be > 0");

    // short 모드는 이 거리 너머를 재지 못해 EXIT 가 나오지 않을 수 있다
    if (cfg.sensor.source == SampleSourceKind::I2c && cfg.sensor.distance_mode == DistanceMode::Short &&
        th.vehicle_absent_mm > SHORT_MODE_MAX_MM)
        Log(LogLevel::Warn, "Config") << "vehicle_absent_mm " << th.vehicle_absent_mm
                                      << " is beyond short distance mode range (" << SHORT_MODE_MAX_MM
                                      << "mm), consider tof_sensor.distance_mode \"long\"";

    const auto& tr = cfg.triggers;
    check_duration(tr.entry_duration, "entry_event.send_duration_seconds");
    check_duration(tr.entry_interval, "entry_event.send_interval_seconds");
    check_duration(tr.periodic_period, "periodic_check.interval_seconds");
    check_duration(tr.periodic_duration, "periodic_check.send_duration_seconds");
    check_duration(tr.periodic_interval, "periodic_check.send_interval_seconds");
    check_duration(tr.fallback_interval, "fallback.periodic_capture.interval_seconds");
    check_duration(cfg.filter.max_sample_age, "max_sample_age_ms");
    check_duration(cfg.sink.timeout, "nvidia.timeout_seconds");
    check_duration(cfg.queue.backoff_initial, "backoff_initial_ms");
    check_duration(cfg.queue.backoff_max, "backoff_max_ms");

    if (tr.entry_enabled && tr.entry_interval.count() <= 0)
        throw ConfigError("entry_event.send_interval_seconds must be > 0");
    if (tr.periodic_enabled) {
        if (tr.periodic_period.count() <= 0)
            throw ConfigError("periodic_check.interval_seconds must be > 0");
        if (tr.periodic_duration.count() <= 0)
            throw ConfigError("periodic_check.send_duration_seconds must be > 0");
        if (tr.periodic_interval.count() <= 0)
            throw ConfigError("periodic_check.send_interval_seconds must be > 0");
    }
    if (tr.fallback_enabled && tr.fallback_interval.count() <= 0)
        throw ConfigError("fallback.periodic_capture.interval_seconds must be > 0");

    if (cfg.sink.port < 1 || cfg.sink.port > 65535) throw ConfigError("nvidia.port out of range");
    if (cfg.sink.protocol != "http" && cfg.sink.protocol != "https")
        throw ConfigError("nvidia.protocol must be http or https");
    if (cfg.sink.endpoint.empty() || cfg.sink.endpoint[0] != '/')
        throw ConfigError("nvidia.endpoint must start with '/'");

    if (cfg.queue.capacity < 1) throw ConfigError("queue_capacity must be >= 1");
    if (cfg.queue.max_retries < 0) throw ConfigError("max_retries must be >= 0");
    if (cfg.queue.backoff_initial.count() < 0 || cfg.queue.backoff_max < cfg.queue.backoff_initial)
        throw ConfigError("backoff_max_ms must be >= backoff_initial_ms >= 0");
    if (cfg.queue.jitter < 0 || cfg.queue.jitter > 1) throw ConfigError("jitter must be in [0, 1]");

    if (cfg.camera.quality < 1 || cfg.camera.quality > 100) throw ConfigError("camera.quality must be 1-100");
    if (cfg.camera.rotation % 90 != 0) throw ConfigError("camera.rotation must be a multiple of 90");

    if (cfg.mqtt.enabled && (cfg.mqtt.port < 1 || cfg.mqtt.port > 65535))
        throw ConfigError("mqtt.port out of range");

    LogLevel lvl;
    if (!parse_log_level(cfg.logging.level, lvl))
        throw ConfigError("unknown logging.level '" + cfg.logging.level + "'");
}

AppConfig load_config(const std::string& path) {
    std::ifstream fin(path);
    if (!fin.is_open()) throw ConfigError("cannot open config file " + path);

    json root;
    try {
        fin >> root;
    } catch (const json::parse_error& e) {
        throw ConfigError("config parse error in " + path + ": " + e.what());
    }
    return parse_config(root);
}

std::string sink_url(const SinkConfig& sink) {
    return sink.protocol + "://" + sink.ip_address + ":" + std::to_string(sink.port) + sink.endpoint;
}
