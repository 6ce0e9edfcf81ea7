#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

#include "config.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

TEST_CASE("empty config yields defaults") {
  AppConfig c = parse_config(json::object());
  REQUIRE(c.thresholds.vehicle_present_mm == 1000);
  REQUIRE(c.thresholds.vehicle_absent_mm == 2000);
  REQUIRE(c.filter.window == 5);
  REQUIRE(c.triggers.entry_duration == 180s);
  REQUIRE(c.triggers.entry_interval == 1s);
  REQUIRE(c.triggers.periodic_period == 300s);
  REQUIRE(c.triggers.periodic_duration == 10s);
  REQUIRE(c.sink.protocol == "http");
  REQUIRE(c.sensor.source == SampleSourceKind::I2c);
  REQUIRE(c.sensor.distance_mode == DistanceMode::Short);
}

TEST_CASE("distance mode is selectable") {
  json j = {{"tof_sensor", {{"distance_mode", "long"}}}};
  REQUIRE(parse_config(j).sensor.distance_mode == DistanceMode::Long);

  j = {{"tof_sensor", {{"distance_mode", "medium"}}}};
  REQUIRE_THROWS_AS(parse_config(j), ConfigError);
}

TEST_CASE("full config is parsed") {
  json j = R"({
    "device": {"station_id": "lot-a", "spot_number": 4},
    "tof_sensor": {
      "source": "zmq",
      "zmq_endpoint": "tcp://127.0.0.1:5556",
      "sampling": {"frequency_hz": 10, "smoothing_window": 3, "smoothing_method": "median",
                   "max_sample_age_ms": 1500},
      "thresholds": {"vehicle_present_mm": 800, "vehicle_absent_mm": 1600},
      "triggers": {
        "entry_event": {"enabled": true, "send_duration_seconds": 60, "send_interval_seconds": 0.5},
        "exit_event": {"enabled": true, "send_immediate": false},
        "periodic_check": {"enabled": false, "interval_seconds": 120}
      }
    },
    "camera": {"resolution": {"width": 1280, "height": 720}, "rotation": 180, "quality": 75},
    "nvidia": {"protocol": "https", "ip_address": "10.1.1.1", "port": 8443,
               "endpoint": "/img", "timeout_seconds": 2.5},
    "transmission": {"queue_capacity": 16, "max_retries": 2, "jitter": 0.1},
    "mqtt": {"enabled": true, "host": "broker", "topic": "spot/alert"},
    "fallback": {"periodic_capture": {"enabled": false, "interval_seconds": 30}},
    "logging": {"level": "DEBUG", "file": "/tmp/spotcam.log"}
  })"_json;

  AppConfig c = parse_config(j);
  REQUIRE(c.device.station_id == "lot-a");
  REQUIRE(c.device.spot_number == 4);
  REQUIRE(c.sensor.source == SampleSourceKind::Zmq);
  REQUIRE(c.sensor.zmq_endpoint == "tcp://127.0.0.1:5556");
  REQUIRE(c.sensor.frequency_hz == 10.0);
  REQUIRE(c.filter.window == 3);
  REQUIRE(c.filter.method == SmoothingMethod::Median);
  REQUIRE(c.filter.max_sample_age == 1500ms);
  REQUIRE(c.thresholds.vehicle_present_mm == 800);
  REQUIRE(c.triggers.entry_duration == 60s);
  REQUIRE(c.triggers.entry_interval == 500ms);
  REQUIRE_FALSE(c.triggers.exit_send_immediate);
  REQUIRE_FALSE(c.triggers.periodic_enabled);
  REQUIRE(c.triggers.periodic_period == 120s);
  REQUIRE_FALSE(c.triggers.fallback_enabled);
  REQUIRE(c.camera.width == 1280);
  REQUIRE(c.camera.rotation == 180);
  REQUIRE(c.sink.timeout == 2500ms);
  REQUIRE(sink_url(c.sink) == "https://10.1.1.1:8443/img");
  REQUIRE(c.queue.capacity == 16);
  REQUIRE(c.queue.max_retries == 2);
  REQUIRE(c.mqtt.enabled);
  REQUIRE(c.mqtt.topic == "spot/alert");
  REQUIRE(c.logging.level == "DEBUG");
}

TEST_CASE("invalid configurations are rejected") {
  SECTION("hysteresis band must be open") {
    json j = {{"tof_sensor", {{"thresholds", {{"vehicle_present_mm", 2000}, {"vehicle_absent_mm", 1000}}}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("equal thresholds") {
    json j = {{"tof_sensor", {{"thresholds", {{"vehicle_present_mm", 1500}, {"vehicle_absent_mm", 1500}}}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("unknown smoothing method") {
    json j = {{"tof_sensor", {{"sampling", {{"smoothing_method", "mode"}}}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("unknown sample source") {
    json j = {{"tof_sensor", {{"source", "uart"}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("zero window") {
    json j = {{"tof_sensor", {{"sampling", {{"smoothing_window", 0}}}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("wrong type") {
    json j = {{"device", {{"spot_number", "seven"}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("negative duration") {
    json j = {{"tof_sensor", {{"triggers", {{"entry_event", {{"send_interval_seconds", -1}}}}}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("duration beyond a day") {
    json j = {{"tof_sensor", {{"triggers", {{"entry_event", {{"send_duration_seconds", 1e10}}}}}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("huge backoff in milliseconds") {
    json j = {{"transmission", {{"backoff_max_ms", 9000000000000LL}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("zero verification duration while verification is enabled") {
    json j = {{"tof_sensor", {{"triggers", {{"periodic_check", {{"enabled", true}, {"send_duration_seconds", 0}}}}}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("unknown log level") {
    json j = {{"logging", {{"level", "LOUD"}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("bad protocol") {
    json j = {{"nvidia", {{"protocol", "ftp"}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("jitter out of range") {
    json j = {{"transmission", {{"jitter", 1.5}}}};
    REQUIRE_THROWS_AS(parse_config(j), ConfigError);
  }
  SECTION("root must be an object") {
    REQUIRE_THROWS_AS(parse_config(json::array()), ConfigError);
  }
}

TEST_CASE("load_config reads a file") {
  const std::string path = "spotcam_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"device": {"station_id": "file-station"}})";
  }
  AppConfig c = load_config(path);
  REQUIRE(c.device.station_id == "file-station");
  std::remove(path.c_str());

  SECTION("missing file") {
    REQUIRE_THROWS_AS(load_config("does/not/exist.json"), ConfigError);
  }
  SECTION("malformed JSON") {
    {
      std::ofstream out(path);
      out << "{ not json";
    }
    REQUIRE_THROWS_AS(load_config(path), ConfigError);
    std::remove(path.c_str());
  }
}
