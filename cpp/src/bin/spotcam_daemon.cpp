// src/bin/spotcam_daemon.cpp

#include "config.hpp"
#include "devices.hpp"
#include "http_sink.hpp"
#include "logger.hpp"
#include "monitor.hpp"
#include "mqtt_utils.hpp"
#include "uploader.hpp"
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>

constexpr auto STATS_LOG_PERIOD = std::chrono::seconds(60);

volatile std::sig_atomic_t running = 1;

void handle_shutdown(int) { running = 0; }

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config <path>]\n";
}

static void log_stats(const SpotMonitor& monitor, const TransmissionQueue& queue) {
    const auto& m = monitor.stats();
    auto q = queue.stats();
    Log(LogLevel::Info, "SpotCam") << "state=" << to_string(monitor.state())
        << " samples=" << m.samples << " missing=" << m.missing_samples
        << " invalid=" << m.invalid_samples << " events=" << m.events
        << " captures=" << m.instructions << " capture_failures=" << m.capture_failures
        << " delivered=" << q.delivered << " pending=" << q.pending
        << " dropped=" << q.dropped << " evicted=" << q.evicted;
}

static int run(const AppConfig& cfg) {
    std::unique_ptr<ErrorReporter> reporter;
    if (cfg.mqtt.enabled) {
        auto mqtt = std::make_unique<MqttReporter>(cfg.mqtt, cfg.device);
        if (!mqtt->connect())
            Log(LogLevel::Warn, "SpotCam") << "MQTT alerts unavailable, logging only";
        reporter = std::move(mqtt);
    } else {
        reporter = std::make_unique<LogReporter>();
    }

    HttpImageSink sink(cfg.sink);
    TransmissionQueue queue(sink, cfg.queue, *reporter);
    queue.start();

    std::unique_ptr<Camera> camera = std::make_unique<OpencvCamera>(cfg.camera);
    if (!camera->initialize()) {
        Log(LogLevel::Warn, "CameraHandler") << "Camera not available. Running in simulation mode.";
        camera = std::make_unique<DummyCamera>();
    }

    std::unique_ptr<SampleSource> sensor = make_sample_source(cfg.sensor);
    const bool sensor_ok = sensor->initialize();

    SpotMonitor monitor(cfg, *camera, queue, *reporter);
    if (!sensor_ok) {
        Log(LogLevel::Info, "SpotCam") << "ToF monitoring disabled";
        monitor.enable_fallback(SteadyClock::now());
    }

    Log(LogLevel::Info, "SpotCam") << "All systems operational";

    const auto period = std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::duration<double>(1.0 / cfg.sensor.frequency_hz));
    TimePoint next = SteadyClock::now();
    TimePoint next_stats = next + STATS_LOG_PERIOD;

    while (running) {
        TimePoint now = SteadyClock::now();
        std::optional<DistanceSample> sample;
        if (sensor->enabled()) sample = sensor->poll(now);
        monitor.step(sample, now);

        if (now >= next_stats) {
            log_stats(monitor, queue);
            next_stats = now + STATS_LOG_PERIOD;
        }

        // 멈췄다 돌아오면 밀린 주기를 따라잡지 않고 지금부터 다시
        next += period;
        if (next < now) next = now + period;
        std::this_thread::sleep_until(next);
    }

    Log(LogLevel::Info, "SpotCam") << "Stopping spotcam";
    queue.stop();
    sensor->close();
    camera->close();
    log_stats(monitor, queue);
    Log(LogLevel::Info, "SpotCam") << "System stopped";
    return 0;
}

int main(int argc, char** argv) {
    std::string config_path = DEFAULT_CONFIG_PATH;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    AppConfig cfg;
    try {
        cfg = load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    LogLevel level = LogLevel::Info;
    if (!parse_log_level(cfg.logging.level, level)) level = LogLevel::Info;
    if (!log_init(level, cfg.logging.file))
        Log(LogLevel::Warn, "SpotCam") << "Logging to stderr only";
    Log(LogLevel::Info, "SpotCam") << "Camera initialized - Station: " << cfg.device.station_id
                                   << " | Spot: " << cfg.device.spot_number;

    std::signal(SIGINT, handle_shutdown);
    std::signal(SIGTERM, handle_shutdown);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        return run(cfg);
    } catch (const ConfigError& e) {
        Log(LogLevel::Error, "SpotCam") << "Configuration error: " << e.what();
        return 1;
    }
}
