// src/sensor/zmq_source.cpp

#include "devices.hpp"
#include "logger.hpp"
#include <zmq.hpp>

struct ZmqSampleSource::Impl {
    zmq::context_t ctx{1};
    zmq::socket_t  sub{ctx, zmq::socket_type::sub};
};

ZmqSampleSource::ZmqSampleSource(const SensorConfig& cfg) : cfg_(cfg) {}

ZmqSampleSource::~ZmqSampleSource() {
    close();
}

bool ZmqSampleSource::initialize() {
    if (!cfg_.enabled) {
        Log(LogLevel::Warn, "ZmqSource") << "ToF sensor disabled";
        return false;
    }
    try {
        impl_ = std::make_unique<Impl>();
        impl_->sub.connect(cfg_.zmq_endpoint);
        impl_->sub.set(zmq::sockopt::subscribe, "");
    } catch (const zmq::error_t& e) {
        Log(LogLevel::Error, "ZmqSource") << "Failed to connect " << cfg_.zmq_endpoint << ": " << e.what();
        impl_.reset();
        return false;
    }
    enabled_ = true;
    Log(LogLevel::Info, "ZmqSource") << "Subscribed to distance samples on " << cfg_.zmq_endpoint;
    return true;
}

std::optional<DistanceSample> ZmqSampleSource::poll(TimePoint now) {
    if (!enabled_) return std::nullopt;

    // 쌓여 있는 메시지 중 가장 최신 것만 사용
    std::optional<DistanceSample> latest;
    try {
        while (true) {
            zmq::message_t frame;
            auto res = impl_->sub.recv(frame, zmq::recv_flags::dontwait);
            if (!res) break;
            auto sample = parse_sample_message(frame.to_string(), now);
            if (sample) latest = sample;
        }
    } catch (const zmq::error_t& e) {
        Log(LogLevel::Warn, "ZmqSource") << "recv failed: " << e.what();
    }
    return latest;
}

void ZmqSampleSource::close() {
    if (!impl_) return;
    try {
        impl_->sub.close();
    } catch (const zmq::error_t& e) {
        Log(LogLevel::Error, "ZmqSource") << "Error closing socket: " << e.what();
    }
    impl_.reset();
    enabled_ = false;
}

std::unique_ptr<SampleSource> make_sample_source(const SensorConfig& cfg) {
    if (cfg.source == SampleSourceKind::Zmq) return std::make_unique<ZmqSampleSource>(cfg);
    return std::make_unique<Vl53l1xSensor>(cfg);
}
