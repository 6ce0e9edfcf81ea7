// include/mqtt_utils.hpp
#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "uploader.hpp"

struct mosquitto;

using json = nlohmann::json;

// {"timestamp": "...", "event": code, "station_id": ..., "spot_number": ...} + extra
json make_event_payload(int event_code, const DeviceConfig& device, const json& extra = json::object());

// 로그 + MQTT 알림. 브로커 연결이 끊겨도 로그는 계속 남는다
class MqttReporter : public ErrorReporter {
public:
    MqttReporter(const MqttConfig& cfg, const DeviceConfig& device);
    ~MqttReporter() override;

    MqttReporter(const MqttReporter&) = delete;
    MqttReporter& operator=(const MqttReporter&) = delete;

    bool connect();
    void disconnect();

    void frame_dropped(const OutboundFrame& frame, const std::string& reason) override;
    void capture_failed(const CaptureInstruction& ins) override;
    void presence_changed(const PresenceEvent& ev) override;

private:
    void publish_event(int event_code, const json& extra = json::object());

    MqttConfig   cfg_;
    DeviceConfig device_;
    LogReporter  log_;
    std::mutex   mu_;
    struct mosquitto* mosq_ = nullptr;
    bool         connected_ = false;
};
