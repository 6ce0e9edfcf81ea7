// src/mqtt/mqtt_reporter.cpp

#include "mqtt_utils.hpp"
#include "logger.hpp"
#include <ctime>
#include <mosquitto.h>

json make_event_payload(int event_code, const DeviceConfig& device, const json& extra) {
    json payload = {
        {"timestamp", [](){
            std::time_t now = std::time(nullptr);
            std::tm tm{};
            localtime_r(&now, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%FT%T", &tm);
            return std::string(buf);
        }()},
        {"event", event_code},
        {"station_id", device.station_id},
        {"spot_number", device.spot_number}
    };
    if (extra.is_object()) payload.update(extra);
    return payload;
}

// Mosquitto 로그 콜백 (디버깅용)
static void log_callback(struct mosquitto*, void*, int, const char* str) {
    Log(LogLevel::Debug, "mosquitto") << str;
}

MqttReporter::MqttReporter(const MqttConfig& cfg, const DeviceConfig& device)
    : cfg_(cfg), device_(device) {}

MqttReporter::~MqttReporter() {
    disconnect();
}

bool MqttReporter::connect() {
    {
        std::lock_guard<std::mutex> g(mu_);
        if (!cfg_.enabled || connected_) return connected_;

        mosquitto_lib_init();
        mosq_ = mosquitto_new(cfg_.client_id.c_str(), true, nullptr);
        if (!mosq_) {
            Log(LogLevel::Error, "MQTT") << "Failed to create mosquitto client";
            mosquitto_lib_cleanup();
            return false;
        }
        mosquitto_log_callback_set(mosq_, log_callback);

        // 브로커가 늦게 떠도 loop 스레드가 재연결한다
        int ret = mosquitto_connect_async(mosq_, cfg_.host.c_str(), cfg_.port, 60);
        if (ret != MOSQ_ERR_SUCCESS)
            Log(LogLevel::Warn, "MQTT") << "Mosquitto connection failed: " << mosquitto_strerror(ret)
                                        << " (will retry in background)";

        ret = mosquitto_loop_start(mosq_);
        if (ret != MOSQ_ERR_SUCCESS) {
            Log(LogLevel::Error, "MQTT") << "Mosquitto loop start failed: " << mosquitto_strerror(ret);
            mosquitto_destroy(mosq_);
            mosq_ = nullptr;
            mosquitto_lib_cleanup();
            return false;
        }
        connected_ = true;
    }
    Log(LogLevel::Info, "MQTT") << "Publishing alerts to " << cfg_.host << ":" << cfg_.port
                                << " topic '" << cfg_.topic << "'";
    publish_event(CONNECTION_SUCCESS);
    return true;
}

void MqttReporter::disconnect() {
    std::lock_guard<std::mutex> g(mu_);
    if (!mosq_) return;
    mosquitto_disconnect(mosq_);
    mosquitto_loop_stop(mosq_, true);
    mosquitto_destroy(mosq_);
    mosquitto_lib_cleanup();
    mosq_ = nullptr;
    connected_ = false;
}

void MqttReporter::publish_event(int event_code, const json& extra) {
    std::lock_guard<std::mutex> g(mu_);
    if (!connected_) return;

    auto msg = make_event_payload(event_code, device_, extra).dump();
    int ret = mosquitto_publish(mosq_, nullptr, cfg_.topic.c_str(),
                                static_cast<int>(msg.size()), msg.c_str(), 1, false);
    if (ret != MOSQ_ERR_SUCCESS)
        Log(LogLevel::Warn, "MQTT") << "publish failed: " << mosquitto_strerror(ret);
    else
        Log(LogLevel::Debug, "MQTT") << "MQTT published: " << msg;
}

void MqttReporter::frame_dropped(const OutboundFrame& frame, const std::string& reason) {
    log_.frame_dropped(frame, reason);
    publish_event(FRAME_DROPPED, {{"reason", reason},
                                  {"capture", to_string(frame.reason)},
                                  {"captured_at", iso8601(frame.captured_at)}});
}

void MqttReporter::capture_failed(const CaptureInstruction& ins) {
    log_.capture_failed(ins);
    publish_event(CAPTURE_FAILED, {{"capture", to_string(ins.reason)}});
}

void MqttReporter::presence_changed(const PresenceEvent& ev) {
    log_.presence_changed(ev);
    publish_event(ev.kind == PresenceEventKind::Enter ? VEHICLE_ENTRY : VEHICLE_EXIT);
}
