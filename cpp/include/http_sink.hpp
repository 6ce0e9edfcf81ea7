// include/http_sink.hpp
#pragma once

#include <string>
#include <openssl/ssl.h>
#include "config.hpp"
#include "uploader.hpp"

// multipart/form-data 본문 (image, station_id, spot_number, timestamp)
std::string build_multipart_body(const OutboundFrame& frame, const std::string& boundary);

// 요청 헤더 + 본문
std::string build_post_request(const SinkConfig& sink, const OutboundFrame& frame,
                               const std::string& boundary);

// "HTTP/1.1 200 OK" → 200, 형식이 틀리면 0
int parse_status_line(const std::string& response);

// Orin 의 /receive_image 로 HTTP(S) POST
class HttpImageSink : public ImageSink {
public:
    explicit HttpImageSink(const SinkConfig& cfg);
    ~HttpImageSink() override;

    HttpImageSink(const HttpImageSink&) = delete;
    HttpImageSink& operator=(const HttpImageSink&) = delete;

    SendResult send(const OutboundFrame& frame) override;

    const std::string& url() const { return url_; }

private:
    int  connect_with_timeout(TimePoint deadline, std::string& err) const;
    bool init_ssl_ctx(std::string& err);

    SinkConfig  cfg_;
    std::string url_;
    SSL_CTX*    ssl_ctx_ = nullptr;
};
