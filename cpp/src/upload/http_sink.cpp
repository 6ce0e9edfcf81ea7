// src/upload/http_sink.cpp (with OpenSSL)

#include "http_sink.hpp"
#include "logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace {

std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

std::string make_boundary() {
    unsigned char raw[12];
    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        static unsigned long counter = 0;
        return "----spotcam-boundary-" + std::to_string(++counter);
    }
    std::string out = "----spotcam-";
    char hex[3];
    for (unsigned char c : raw) {
        std::snprintf(hex, sizeof(hex), "%02x", c);
        out += hex;
    }
    return out;
}

constexpr const char* SEND_TIMEOUT = "Image send timeout";

// 마감까지 남은 ms (지났으면 0)
int remaining_ms(TimePoint deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// fd 가 events 준비될 때까지 마감 안에서 대기. 1 준비, 0 시간 초과, -1 에러
int wait_fd(int fd, short events, TimePoint deadline) {
    while (true) {
        int left = remaining_ms(deadline);
        if (left <= 0) return 0;
        pollfd pfd{fd, events, 0};
        int rc = poll(&pfd, 1, left);
        if (rc > 0) return 1;
        if (rc == 0) return 0;
        if (errno != EINTR) return -1;
    }
}

// 논블로킹 소켓 위의 SSL 호출을 WANT_READ/WANT_WRITE 가 풀릴 때까지 반복
template <typename Op>
int ssl_call(SSL* ssl, int fd, TimePoint deadline, bool& timed_out, Op op) {
    while (true) {
        int n = op();
        if (n > 0) return n;
        int e = SSL_get_error(ssl, n);
        short events;
        if (e == SSL_ERROR_WANT_READ)       events = POLLIN;
        else if (e == SSL_ERROR_WANT_WRITE) events = POLLOUT;
        else return n;
        int w = wait_fd(fd, events, deadline);
        if (w == 0) timed_out = true;
        if (w <= 0) return -1;
    }
}

void append_field(std::string& body, const std::string& boundary,
                  const std::string& name, const std::string& value) {
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    body += value;
    body += "\r\n";
}

} // namespace

std::string build_multipart_body(const OutboundFrame& frame, const std::string& boundary) {
    std::string body;
    body.reserve(frame.image.size() + 512);

    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"image\"; filename=\"capture.jpg\"\r\n";
    body += "Content-Type: image/jpeg\r\n\r\n";
    body.append(reinterpret_cast<const char*>(frame.image.data()), frame.image.size());
    body += "\r\n";

    append_field(body, boundary, "station_id", frame.station_id);
    append_field(body, boundary, "spot_number", std::to_string(frame.spot_number));
    append_field(body, boundary, "timestamp", iso8601(frame.captured_at));

    body += "--" + boundary + "--\r\n";
    return body;
}

std::string build_post_request(const SinkConfig& sink, const OutboundFrame& frame,
                               const std::string& boundary) {
    std::string body = build_multipart_body(frame, boundary);

    std::ostringstream req;
    req << "POST " << sink.endpoint << " HTTP/1.1\r\n"
        << "Host: " << sink.ip_address << ":" << sink.port << "\r\n"
        << "User-Agent: spotcam\r\n"
        << "Accept: */*\r\n"
        << "Content-Type: multipart/form-data; boundary=" << boundary << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n";
    return req.str() + body;
}

int parse_status_line(const std::string& response) {
    // HTTP/1.1 200 OK
    if (response.compare(0, 5, "HTTP/") != 0) return 0;
    auto sp = response.find(' ');
    if (sp == std::string::npos || sp + 4 > response.size()) return 0;
    int code = 0;
    for (std::size_t i = sp + 1; i < sp + 4; ++i) {
        char c = response[i];
        if (c < '0' || c > '9') return 0;
        code = code * 10 + (c - '0');
    }
    if (sp + 4 < response.size() && response[sp + 4] != ' ' && response[sp + 4] != '\r')
        return 0;
    return code;
}

// ----------------- HttpImageSink ----------------- //

HttpImageSink::HttpImageSink(const SinkConfig& cfg) : cfg_(cfg), url_(sink_url(cfg)) {
    if (cfg_.protocol == "https") {
        std::string err;
        if (!init_ssl_ctx(err)) throw ConfigError("TLS setup failed: " + err);
    }
    Log(LogLevel::Info, "NVIDIAClient") << "NVIDIA client configured: " << url_;
}

HttpImageSink::~HttpImageSink() {
    if (ssl_ctx_) SSL_CTX_free(ssl_ctx_);
}

// TLS 초기화 (클라이언트 인증서는 선택)
bool HttpImageSink::init_ssl_ctx(std::string& err) {
    ssl_ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ssl_ctx_) {
        err = ssl_error_string();
        return false;
    }
    if (!cfg_.client_cert.empty()) {
        if (SSL_CTX_use_certificate_file(ssl_ctx_, cfg_.client_cert.c_str(), SSL_FILETYPE_PEM) <= 0 ||
            SSL_CTX_use_PrivateKey_file(ssl_ctx_, cfg_.client_key.c_str(), SSL_FILETYPE_PEM) <= 0) {
            err = "client certificate: " + ssl_error_string();
            return false;
        }
        if (!SSL_CTX_check_private_key(ssl_ctx_)) {
            err = "private key does not match certificate";
            return false;
        }
    }
    if (!cfg_.ca_cert.empty()) {
        if (!SSL_CTX_load_verify_locations(ssl_ctx_, cfg_.ca_cert.c_str(), nullptr)) {
            err = "CA file: " + ssl_error_string();
            return false;
        }
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_verify_depth(ssl_ctx_, 4);
    } else {
        Log(LogLevel::Warn, "NVIDIAClient") << "No CA certificate configured, server is not verified";
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
    }
    return true;
}

// 논블로킹 connect. 성공한 소켓은 논블로킹 상태로 돌려준다
int HttpImageSink::connect_with_timeout(TimePoint deadline, std::string& err) const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    std::string port = std::to_string(cfg_.port);
    int rc = getaddrinfo(cfg_.ip_address.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
        err = std::string("resolve ") + cfg_.ip_address + ": " + gai_strerror(rc);
        return -1;
    }

    int sock = -1;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            err = std::string("socket: ") + strerror(errno);
            continue;
        }

        int flags = fcntl(sock, F_GETFL, 0);
        if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
            err = std::string("fcntl: ") + strerror(errno);
            close(sock);
            sock = -1;
            continue;
        }

        rc = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno == EINPROGRESS) {
            int w = wait_fd(sock, POLLOUT, deadline);
            if (w == 0) {
                err = SEND_TIMEOUT;
                rc = -1;
            } else if (w < 0) {
                err = std::string("poll: ") + strerror(errno);
                rc = -1;
            } else {
                int so_err = 0;
                socklen_t len = sizeof(so_err);
                if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_err, &len) < 0) so_err = errno;
                if (so_err != 0) {
                    err = std::string("connect: ") + strerror(so_err);
                    rc = -1;
                } else {
                    rc = 0;
                }
            }
        } else if (rc < 0) {
            err = std::string("connect: ") + strerror(errno);
        }

        if (rc == 0) break;
        close(sock);
        sock = -1;
        if (err == SEND_TIMEOUT) break;   // 남은 시간이 없다
    }
    freeaddrinfo(res);
    return sock;
}

SendResult HttpImageSink::send(const OutboundFrame& frame) {
    SendResult result;
    std::string err;

    // 연결부터 상태 줄 수신까지 한 번의 시도 전체에 걸리는 마감
    const TimePoint deadline = SteadyClock::now() + cfg_.timeout;
    bool timed_out = false;

    int sock = connect_with_timeout(deadline, err);
    if (sock < 0) {
        result.error = err.empty() ? "connect failed" : err;
        return result;
    }

    SSL* ssl = nullptr;
    if (ssl_ctx_) {
        ssl = SSL_new(ssl_ctx_);
        if (!ssl || SSL_set_fd(ssl, sock) != 1) {
            result.error = "TLS setup: " + ssl_error_string();
            if (ssl) SSL_free(ssl);
            close(sock);
            return result;
        }
        if (ssl_call(ssl, sock, deadline, timed_out, [&] { return SSL_connect(ssl); }) <= 0) {
            result.error = timed_out ? SEND_TIMEOUT : "TLS handshake: " + ssl_error_string();
            SSL_free(ssl);
            close(sock);
            return result;
        }
    }

    const std::string request = build_post_request(cfg_, frame, make_boundary());

    // 요청 전송 (부분 쓰기 반복)
    std::size_t sent = 0;
    bool io_ok = true;
    while (sent < request.size()) {
        const char* data = request.data() + sent;
        const std::size_t left = request.size() - sent;
        int n;
        if (ssl) {
            n = ssl_call(ssl, sock, deadline, timed_out,
                         [&] { return SSL_write(ssl, data, static_cast<int>(left)); });
        } else {
            int w = wait_fd(sock, POLLOUT, deadline);
            if (w == 0) timed_out = true;
            n = w > 0 ? static_cast<int>(::send(sock, data, left, MSG_NOSIGNAL)) : -1;
            if (n < 0 && w > 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
        }
        if (n <= 0) {
            result.error = timed_out ? SEND_TIMEOUT : "write failed";
            io_ok = false;
            break;
        }
        sent += static_cast<std::size_t>(n);
    }

    // 상태 줄만 있으면 충분
    std::string response;
    if (io_ok) {
        char buf[1024];
        while (response.find("\r\n") == std::string::npos && response.size() < 8192) {
            if (remaining_ms(deadline) <= 0) {
                timed_out = true;
                break;
            }
            int n;
            if (ssl) {
                n = ssl_call(ssl, sock, deadline, timed_out,
                             [&] { return SSL_read(ssl, buf, sizeof(buf)); });
            } else {
                int w = wait_fd(sock, POLLIN, deadline);
                if (w == 0) timed_out = true;
                n = w > 0 ? static_cast<int>(::recv(sock, buf, sizeof(buf), 0)) : -1;
                if (n < 0 && w > 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
            }
            if (n <= 0) break;
            response.append(buf, static_cast<std::size_t>(n));
        }
        if (timed_out) {
            result.error = SEND_TIMEOUT;
            io_ok = false;
        } else if (response.empty()) {
            result.error = "no response";
            io_ok = false;
        }
    }

    if (ssl) {
        // close_notify 는 최선 시도. 실패해도 연결은 닫는다
        if (SSL_shutdown(ssl) < 0) ERR_clear_error();
        SSL_free(ssl);
    }
    close(sock);

    if (!io_ok) return result;

    result.status = parse_status_line(response);
    result.ok = result.status >= 200 && result.status < 300;
    if (result.status == 0) result.error = "malformed HTTP response";
    return result;
}
