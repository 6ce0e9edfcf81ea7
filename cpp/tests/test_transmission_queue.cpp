#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

#include "fakes.hpp"
#include "uploader.hpp"

using namespace std::chrono_literals;

static QueueConfig queue_cfg(std::size_t capacity, int max_retries) {
  QueueConfig c;
  c.capacity = capacity;
  c.max_retries = max_retries;
  c.backoff_initial = 500ms;
  c.backoff_max = 4000ms;
  c.jitter = 0.0;
  return c;
}

static OutboundFrame frame_for(int spot) {
  OutboundFrame f;
  f.image = {0xFF, 0xD8, 0xFF, 0xD9};
  f.station_id = "st";
  f.spot_number = spot;
  return f;
}

// 대기열이 빌 때까지 재시도 시각에 맞춰 시도
static void drain(TransmissionQueue& q, double start = 0) {
  TimePoint now = at(start);
  for (int i = 0; i < 1000; ++i) {
    auto next = q.next_attempt_at();
    if (!next) return;
    if (*next > now) now = *next;
    q.process_once(now);
  }
}

TEST_CASE("failures within the retry ceiling are delivered exactly once") {
  FakeSink sink;
  RecordingReporter rep;
  TransmissionQueue q(sink, queue_cfg(8, 3), rep, 1);

  sink.fail_first = 3;
  REQUIRE(q.enqueue(frame_for(1)));
  drain(q);

  REQUIRE(sink.attempts == 4);
  REQUIRE(sink.delivered.size() == 1);
  REQUIRE(rep.dropped.empty());
  auto s = q.stats();
  REQUIRE(s.delivered == 1);
  REQUIRE(s.failed_attempts == 3);
  REQUIRE(s.pending == 0);
}

TEST_CASE("failures beyond the ceiling drop the frame and report it") {
  FakeSink sink;
  RecordingReporter rep;
  TransmissionQueue q(sink, queue_cfg(8, 2), rep, 1);

  sink.fail_first = 100;
  q.enqueue(frame_for(1));
  drain(q);

  REQUIRE(sink.attempts == 3);
  REQUIRE(sink.delivered.empty());
  REQUIRE(rep.dropped.size() == 1);
  REQUIRE(q.stats().dropped == 1);
  REQUIRE_FALSE(q.next_attempt_at().has_value());
}

TEST_CASE("retries wait for the backoff delay") {
  FakeSink sink;
  RecordingReporter rep;
  TransmissionQueue q(sink, queue_cfg(8, 5), rep, 1);

  sink.fail_first = 1;
  q.enqueue(frame_for(1));
  REQUIRE(q.process_once(at(0)));
  REQUIRE(q.next_attempt_at() == at(0.5));

  REQUIRE_FALSE(q.process_once(at(0.4)));
  REQUIRE(sink.attempts == 1);
  REQUIRE(q.process_once(at(0.5)));
  REQUIRE(sink.delivered.size() == 1);
}

TEST_CASE("backoff doubles up to the cap") {
  FakeSink sink;
  RecordingReporter rep;
  TransmissionQueue q(sink, queue_cfg(8, 10), rep, 1);
  REQUIRE(q.base_backoff(0) == 0ms);
  REQUIRE(q.base_backoff(1) == 500ms);
  REQUIRE(q.base_backoff(2) == 1000ms);
  REQUIRE(q.base_backoff(3) == 2000ms);
  REQUIRE(q.base_backoff(4) == 4000ms);
  REQUIRE(q.base_backoff(9) == 4000ms);
}

TEST_CASE("jittered retry stays within the jitter band") {
  FakeSink sink;
  RecordingReporter rep;
  QueueConfig c = queue_cfg(8, 5);
  c.jitter = 0.2;
  TransmissionQueue q(sink, c, rep, 42);

  sink.fail_first = 1;
  q.enqueue(frame_for(1));
  q.process_once(at(0));
  auto next = q.next_attempt_at();
  REQUIRE(next.has_value());
  REQUIRE(*next >= at(0.4));
  REQUIRE(*next <= at(0.6));
}

TEST_CASE("frames are delivered in enqueue order") {
  FakeSink sink;
  RecordingReporter rep;
  TransmissionQueue q(sink, queue_cfg(8, 5), rep, 1);

  sink.fail_first = 2;   // 첫 프레임이 재시도되는 동안 뒤 프레임은 기다린다
  for (int i = 1; i <= 5; ++i) q.enqueue(frame_for(i));
  drain(q);

  REQUIRE(sink.delivered.size() == 5);
  for (int i = 0; i < 5; ++i) {
    REQUIRE(sink.delivered[i].spot_number == i + 1);
    REQUIRE(sink.delivered[i].sequence == uint64_t(i));
  }
}

TEST_CASE("a full queue evicts the oldest pending frame") {
  FakeSink sink;
  RecordingReporter rep;
  TransmissionQueue q(sink, queue_cfg(3, 5), rep, 1);

  REQUIRE(q.enqueue(frame_for(1)));
  REQUIRE(q.enqueue(frame_for(2)));
  REQUIRE(q.enqueue(frame_for(3)));
  REQUIRE_FALSE(q.enqueue(frame_for(4)));

  REQUIRE(rep.dropped.size() == 1);
  auto s = q.stats();
  REQUIRE(s.evicted == 1);
  REQUIRE(s.pending == 3);

  drain(q);
  REQUIRE(sink.delivered.size() == 3);
  REQUIRE(sink.delivered[0].spot_number == 2);
  REQUIRE(sink.delivered[2].spot_number == 4);
}

TEST_CASE("queue length never exceeds capacity") {
  FakeSink sink;
  RecordingReporter rep;
  TransmissionQueue q(sink, queue_cfg(4, 5), rep, 1);
  for (int i = 0; i < 50; ++i) {
    q.enqueue(frame_for(i));
    REQUIRE(q.stats().pending <= 4);
  }
  REQUIRE(q.stats().evicted == 46);
}

TEST_CASE("zero capacity is rejected") {
  FakeSink sink;
  RecordingReporter rep;
  REQUIRE_THROWS_AS(TransmissionQueue(sink, queue_cfg(0, 1), rep, 1), ConfigError);
}

TEST_CASE("worker thread delivers without blocking enqueue") {
  FakeSink sink;
  RecordingReporter rep;
  TransmissionQueue q(sink, queue_cfg(8, 5), rep, 1);
  q.start();
  q.enqueue(frame_for(1));
  q.enqueue(frame_for(2));

  for (int i = 0; i < 200 && q.stats().delivered < 2; ++i)
    std::this_thread::sleep_for(10ms);
  q.stop();

  REQUIRE(q.stats().delivered == 2);
}
