#include <catch2/catch_test_macros.hpp>
#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

#include "http_sink.hpp"

using namespace std::chrono_literals;

// 127.0.0.1 에서 연결 하나를 받아 요청을 다 읽은 뒤 reply 를 돌려주는 서버.
//   reply 가 비어 있으면 응답 없이 연결만 잡고 있는다
//   drip > 0 이면 reply 를 한 바이트씩 drip 간격으로 보낸다
class LoopbackServer {
public:
  explicit LoopbackServer(std::string reply, std::chrono::milliseconds drip = 0ms)
      : reply_(std::move(reply)), drip_(drip) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd_ >= 0);
    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(fd_, 4) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port_ = ntohs(addr.sin_port);
    worker_ = std::thread([this] { serve(); });
  }

  ~LoopbackServer() {
    stop_ = true;
    ::shutdown(fd_, SHUT_RDWR);
    worker_.join();
    ::close(fd_);
  }

  int port() const { return port_; }

private:
  bool stopping() const { return stop_.load(); }

  void serve() {
    pollfd pfd{fd_, POLLIN, 0};
    while (!stopping() && ::poll(&pfd, 1, 50) == 0) {}
    if (stopping()) return;
    int c = ::accept(fd_, nullptr, nullptr);
    if (c < 0) return;

    // 본문은 "--<boundary>--\r\n" 로 끝난다
    std::string req;
    char buf[4096];
    pollfd cfd{c, POLLIN, 0};
    while (!stopping() && req.size() < (1u << 20)) {
      if (req.size() >= 4 && req.compare(req.size() - 4, 4, "--\r\n") == 0) break;
      if (::poll(&cfd, 1, 50) <= 0) continue;
      ssize_t n = ::recv(c, buf, sizeof(buf), 0);
      if (n <= 0) break;
      req.append(buf, static_cast<std::size_t>(n));
    }

    if (!reply_.empty()) {
      if (drip_.count() == 0) {
        ::send(c, reply_.data(), reply_.size(), MSG_NOSIGNAL);
      } else {
        for (char ch : reply_) {
          if (stopping() || ::send(c, &ch, 1, MSG_NOSIGNAL) != 1) break;
          std::this_thread::sleep_for(drip_);
        }
      }
    }
    while (!stopping()) std::this_thread::sleep_for(10ms);
    ::close(c);
  }

  std::string               reply_;
  std::chrono::milliseconds drip_;
  int                       fd_ = -1;
  int                       port_ = 0;
  std::atomic<bool>         stop_{false};
  std::thread               worker_;
};

static SinkConfig loopback_sink(int port, std::chrono::milliseconds timeout) {
  SinkConfig s;
  s.ip_address = "127.0.0.1";
  s.port = port;
  s.timeout = timeout;
  return s;
}

static long long elapsed_ms(SteadyClock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - since).count();
}

static OutboundFrame jpeg_frame() {
  OutboundFrame f;
  f.image = {0xFF, 0xD8, 0x00, 0x01, 0xFF, 0xD9};
  f.station_id = "station-3";
  f.spot_number = 7;
  f.captured_at = std::chrono::system_clock::now();
  f.reason = CaptureReason::ExitConfirm;
  return f;
}

static bool contains(const std::string& s, const std::string& needle) {
  return s.find(needle) != std::string::npos;
}

TEST_CASE("multipart body carries the image and spot metadata") {
  const std::string b = "XYZ";
  OutboundFrame f = jpeg_frame();
  std::string body = build_multipart_body(f, b);

  REQUIRE(body.rfind("--XYZ\r\n", 0) == 0);
  REQUIRE(contains(body, "name=\"image\"; filename=\"capture.jpg\"\r\nContent-Type: image/jpeg\r\n\r\n"));
  REQUIRE(contains(body, std::string("\xFF\xD8\x00\x01\xFF\xD9", 6)));
  REQUIRE(contains(body, "name=\"station_id\"\r\n\r\nstation-3\r\n"));
  REQUIRE(contains(body, "name=\"spot_number\"\r\n\r\n7\r\n"));
  REQUIRE(contains(body, "name=\"timestamp\"\r\n\r\n" + iso8601(f.captured_at) + "\r\n"));

  const std::string tail = "--XYZ--\r\n";
  REQUIRE(body.size() > tail.size());
  REQUIRE(body.compare(body.size() - tail.size(), tail.size(), tail) == 0);
}

TEST_CASE("POST request targets the configured endpoint") {
  SinkConfig sink;
  sink.ip_address = "10.0.0.5";
  sink.port = 8080;
  sink.endpoint = "/receive_image";

  OutboundFrame f = jpeg_frame();
  std::string req = build_post_request(sink, f, "B0");
  std::string body = build_multipart_body(f, "B0");

  REQUIRE(req.rfind("POST /receive_image HTTP/1.1\r\n", 0) == 0);
  REQUIRE(contains(req, "Host: 10.0.0.5:8080\r\n"));
  REQUIRE(contains(req, "Content-Type: multipart/form-data; boundary=B0\r\n"));
  REQUIRE(contains(req, "Content-Length: " + std::to_string(body.size()) + "\r\n"));

  auto split = req.find("\r\n\r\n");
  REQUIRE(split != std::string::npos);
  REQUIRE(req.substr(split + 4) == body);
}

TEST_CASE("status line parsing") {
  REQUIRE(parse_status_line("HTTP/1.1 200 OK\r\n") == 200);
  REQUIRE(parse_status_line("HTTP/1.0 503 Service Unavailable\r\n") == 503);
  REQUIRE(parse_status_line("HTTP/1.1 204\r\n") == 204);
  REQUIRE(parse_status_line("HTTP/1.1 404") == 404);
  REQUIRE(parse_status_line("") == 0);
  REQUIRE(parse_status_line("garbage") == 0);
  REQUIRE(parse_status_line("HTTP/1.1 2x0 OK") == 0);
  REQUIRE(parse_status_line("HTTP/1.1 2000 OK") == 0);
}

TEST_CASE("sink URL") {
  SinkConfig sink;
  sink.protocol = "https";
  sink.ip_address = "orin.local";
  sink.port = 5443;
  sink.endpoint = "/upload";
  REQUIRE(sink_url(sink) == "https://orin.local:5443/upload");

  HttpImageSink http(SinkConfig{});
  REQUIRE(http.url() == "http://192.168.1.100:5000/receive_image");
}

TEST_CASE("2xx response counts as delivered") {
  LoopbackServer server("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
  HttpImageSink sink(loopback_sink(server.port(), 2000ms));
  SendResult r = sink.send(jpeg_frame());
  REQUIRE(r.ok);
  REQUIRE(r.status == 200);
}

TEST_CASE("non-2xx response is a failed attempt") {
  LoopbackServer server("HTTP/1.1 503 Service Unavailable\r\n\r\n");
  HttpImageSink sink(loopback_sink(server.port(), 2000ms));
  SendResult r = sink.send(jpeg_frame());
  REQUIRE_FALSE(r.ok);
  REQUIRE(r.status == 503);
}

TEST_CASE("refused connection is a failed attempt with an error") {
  int port = 0;
  {
    // 포트를 하나 잡았다가 listen 없이 닫는다
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port = ntohs(addr.sin_port);
    ::close(fd);
  }
  HttpImageSink sink(loopback_sink(port, 2000ms));
  SendResult r = sink.send(jpeg_frame());
  REQUIRE_FALSE(r.ok);
  REQUIRE(r.status == 0);
  REQUIRE_FALSE(r.error.empty());
}

TEST_CASE("silent peer times out within the request timeout") {
  LoopbackServer server("");
  HttpImageSink sink(loopback_sink(server.port(), 500ms));
  auto t0 = SteadyClock::now();
  SendResult r = sink.send(jpeg_frame());
  REQUIRE_FALSE(r.ok);
  REQUIRE(r.error == "Image send timeout");
  REQUIRE(elapsed_ms(t0) < 1500);
}

TEST_CASE("slowly trickled response is bounded by the total request timeout") {
  // 상태 줄 17 바이트를 200ms 간격으로 보내면 3초 이상 걸린다
  LoopbackServer server("HTTP/1.1 200 OK\r\n", 200ms);
  HttpImageSink sink(loopback_sink(server.port(), 600ms));
  auto t0 = SteadyClock::now();
  SendResult r = sink.send(jpeg_frame());
  REQUIRE_FALSE(r.ok);
  REQUIRE(r.error == "Image send timeout");
  REQUIRE(elapsed_ms(t0) < 1500);
}
