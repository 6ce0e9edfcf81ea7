// src/sensor/sample_message.cpp

#include "devices.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::optional<DistanceSample> parse_sample_message(const std::string& payload, TimePoint now) {
    json msg;
    try {
        msg = json::parse(payload);
    } catch (const json::parse_error& e) {
        Log(LogLevel::Warn, "ZmqSource") << "JSON parse error: " << e.what();
        return std::nullopt;
    }
    if (!msg.is_object() || !msg.contains("distance_mm")) return std::nullopt;

    DistanceSample sample{now, std::nullopt};
    const auto& d = msg["distance_mm"];
    if (d.is_number_unsigned()) {
        sample.distance_mm = d.get<uint32_t>();
    } else if (d.is_number_integer() && d.get<long long>() >= 0) {
        sample.distance_mm = static_cast<uint32_t>(d.get<long long>());
    } else if (!d.is_null()) {
        return std::nullopt;
    }
    // 드라이버가 명시적으로 무효라고 표시한 경우
    if (msg.contains("valid")) {
        const auto& v = msg["valid"];
        if (!v.is_boolean()) return std::nullopt;
        if (!v.get<bool>()) sample.distance_mm.reset();
    }
    return sample;
}
