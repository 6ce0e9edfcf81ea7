// src/opencv/camera.cpp

#include "devices.hpp"
#include "logger.hpp"
#include <opencv2/opencv.hpp>

struct OpencvCamera::Impl {
    cv::VideoCapture cap;
};

namespace {

std::vector<int> encode_params(const CameraConfig& cfg) {
    return { cv::IMWRITE_JPEG_QUALITY, cfg.quality };
}

// 밝기 보정 (퍼센트 → 픽셀 오프셋)
void apply_brightness(cv::Mat& img, int brightness) {
    if (brightness == 0) return;
    img.convertTo(img, -1, 1.0, brightness * 255.0 / 100.0);
}

void apply_rotation(cv::Mat& img, int rotation) {
    switch (((rotation % 360) + 360) % 360) {
        case 90:  cv::rotate(img, img, cv::ROTATE_90_CLOCKWISE); break;
        case 180: cv::rotate(img, img, cv::ROTATE_180); break;
        case 270: cv::rotate(img, img, cv::ROTATE_90_COUNTERCLOCKWISE); break;
        default: break;
    }
}

} // namespace

OpencvCamera::OpencvCamera(const CameraConfig& cfg) : cfg_(cfg) {}

OpencvCamera::~OpencvCamera() {
    close();
}

bool OpencvCamera::initialize() {
    if (cfg_.format != "jpeg" && cfg_.format != "jpg") {
        Log(LogLevel::Warn, "CameraHandler") << "Unsupported image format '" << cfg_.format
                                             << "', encoding as JPEG";
    }
    try {
        impl_ = std::make_unique<Impl>();
        if (!impl_->cap.open(cfg_.device, cv::CAP_V4L2)) {
            Log(LogLevel::Error, "CameraHandler") << "Failed to initialize camera: /dev/video"
                                                  << cfg_.device << " open failed";
            impl_.reset();
            return false;
        }
        impl_->cap.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
        impl_->cap.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
    } catch (const cv::Exception& e) {
        Log(LogLevel::Error, "CameraHandler") << "Failed to initialize camera: " << e.what();
        impl_.reset();
        return false;
    }

    Log(LogLevel::Info, "CameraHandler") << "Camera initialized: "
        << static_cast<int>(impl_->cap.get(cv::CAP_PROP_FRAME_WIDTH)) << "x"
        << static_cast<int>(impl_->cap.get(cv::CAP_PROP_FRAME_HEIGHT));
    return true;
}

std::optional<std::vector<unsigned char>> OpencvCamera::capture() {
    if (!impl_) return std::nullopt;
    try {
        cv::Mat frame;
        if (!impl_->cap.read(frame) || frame.empty()) {
            Log(LogLevel::Error, "CameraHandler") << "Failed to capture image: frame read failed";
            return std::nullopt;
        }
        apply_rotation(frame, cfg_.rotation);
        apply_brightness(frame, cfg_.brightness);

        std::vector<uchar> buf;
        if (!cv::imencode(".jpg", frame, buf, encode_params(cfg_))) {
            Log(LogLevel::Error, "CameraHandler") << "Failed to capture image: JPEG encode failed";
            return std::nullopt;
        }
        return buf;
    } catch (const cv::Exception& e) {
        Log(LogLevel::Error, "CameraHandler") << "Failed to capture image: " << e.what();
        return std::nullopt;
    }
}

void OpencvCamera::close() {
    if (!impl_) return;
    impl_->cap.release();
    impl_.reset();
}

std::optional<std::vector<unsigned char>> DummyCamera::capture() {
    cv::Mat img(480, 640, CV_8UC3, cv::Scalar(255, 0, 0));   // BGR 파란색
    std::vector<uchar> buf;
    if (!cv::imencode(".jpg", img, buf, { cv::IMWRITE_JPEG_QUALITY, 85 })) return std::nullopt;
    return buf;
}
