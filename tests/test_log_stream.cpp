#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "device_fakes.hpp"
#include "logstream/log_stream.hpp"
#include "my_error_codes.hpp"
#include "util/io_context_manager.hpp"

using namespace carrierctrl;
using namespace std::chrono_literals;

namespace {

constexpr const char *kSimReadyLine =
    "Mar  3 10:15:02 iPhone CommCenter(CoreTelephony)[81] <Notice>: SIM is "
    "ready";

class LineCollector {
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;

public:
  logstream::LogStream::LineCallback callback() {
    return [this](const std::string &line) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(line);
      }
      cv_.notify_all();
    };
  }

  bool wait_for(std::size_t n, std::chrono::milliseconds timeout = 2s) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return lines_.size() >= n; });
  }

  std::vector<std::string> lines() {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }
};

logstream::PatternFilterPtr filter(const std::string &pattern,
                                   logstream::FilterMode mode =
                                       logstream::FilterMode::OneShot) {
  logstream::FilterOptions options{pattern};
  options.mode = mode;
  return logstream::PatternFilter::create(options).value();
}

} // namespace

class LogStreamTest : public ::testing::Test {
protected:
  void SetUp() override {
    stream = std::make_shared<logstream::LogStream>(io.ioc(), syslog, session);
  }

  void TearDown() override {
    io.stop();
    stream.reset();
  }

  testinfra::FakeSyslogSource syslog;
  device::DeviceSession session;
  IoContextManager io{1};
  std::shared_ptr<logstream::LogStream> stream;
};

TEST_F(LogStreamTest, SubscribeWithoutDeviceFails) {
  LineCollector collector;
  auto r = stream->subscribe(filter("SIM is ready"), collector.callback());
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::DEVICE::NO_DEVICE);
  EXPECT_EQ(syslog.starts.load(), 0);
  EXPECT_FALSE(stream->capturing());
}

TEST_F(LogStreamTest, NullFilterIsRejected) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  auto r = stream->subscribe(nullptr, {});
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::LOGSTREAM::FILTER_CONSTRUCTION);
}

TEST_F(LogStreamTest, CaptureFailureIsReported) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  syslog.fail_with =
      make_error(my_errors::DEVICE::SERVICE_START_FAILED, "relay refused");
  auto r = stream->subscribe(filter("SIM"), {});
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::LOGSTREAM::CAPTURE_FAILED);
  EXPECT_EQ(stream->active_subscriptions(), 0u);
}

TEST_F(LogStreamTest, CaptureFollowsSubscriptions) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  auto first = stream->subscribe(filter("a"), {});
  auto second = stream->subscribe(filter("b"), {});
  ASSERT_TRUE(first.is_ok());
  ASSERT_TRUE(second.is_ok());
  EXPECT_EQ(syslog.starts.load(), 1);
  EXPECT_TRUE(stream->capturing());

  stream->unsubscribe(first.value());
  EXPECT_TRUE(stream->capturing());
  stream->unsubscribe(second.value());
  EXPECT_FALSE(stream->capturing());
  EXPECT_EQ(syslog.stops.load(), 1);
}

TEST_F(LogStreamTest, UnsubscribeIsIdempotent) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  auto r = stream->subscribe(filter("SIM"), {});
  ASSERT_TRUE(r.is_ok());
  stream->unsubscribe(r.value());
  stream->unsubscribe(r.value());
  stream->unsubscribe(9999);
  EXPECT_EQ(stream->active_subscriptions(), 0u);
  EXPECT_EQ(syslog.stops.load(), 1);
}

TEST_F(LogStreamTest, DeliversInArrivalOrder) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  LineCollector collector;
  auto r = stream->subscribe(
      filter("line", logstream::FilterMode::Persistent), collector.callback());
  ASSERT_TRUE(r.is_ok());

  for (int i = 0; i < 20; ++i) {
    syslog.emit("line " + std::to_string(i));
  }
  syslog.emit("something else");
  ASSERT_TRUE(collector.wait_for(20));
  auto lines = collector.lines();
  ASSERT_EQ(lines.size(), 20u);
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(lines[i], "line " + std::to_string(i));
  }
}

TEST_F(LogStreamTest, OneShotIsDroppedAfterItsLine) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  LineCollector once;
  LineCollector always;
  ASSERT_TRUE(stream->subscribe(filter("SIM is ready"), once.callback()).is_ok());
  ASSERT_TRUE(stream
                  ->subscribe(filter("CommCenter",
                                     logstream::FilterMode::Persistent),
                              always.callback())
                  .is_ok());

  syslog.emit(kSimReadyLine);
  syslog.emit(kSimReadyLine);
  ASSERT_TRUE(always.wait_for(2));
  EXPECT_EQ(once.lines().size(), 1u);
  EXPECT_EQ(stream->active_subscriptions(), 1u);
  EXPECT_TRUE(stream->capturing());
}

TEST_F(LogStreamTest, ThrowingSubscriberDoesNotStopDelivery) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  LineCollector collector;
  ASSERT_TRUE(stream
                  ->subscribe(filter("SIM", logstream::FilterMode::Persistent),
                              [](const std::string &) {
                                throw std::runtime_error("subscriber bug");
                              })
                  .is_ok());
  ASSERT_TRUE(stream
                  ->subscribe(filter("SIM", logstream::FilterMode::Persistent),
                              collector.callback())
                  .is_ok());
  syslog.emit(kSimReadyLine);
  syslog.emit(kSimReadyLine);
  EXPECT_TRUE(collector.wait_for(2));
}

TEST_F(LogStreamTest, CaptureRestartsForNewDevice) {
  auto first = testinfra::FakeDeviceHandle::iphone();
  session.replace(first);
  ASSERT_TRUE(stream->subscribe(filter("a"), {}).is_ok());
  EXPECT_EQ(syslog.last_handle, first);

  auto second = std::make_shared<testinfra::FakeDeviceHandle>("other-udid");
  session.replace(second);
  ASSERT_TRUE(stream->subscribe(filter("b"), {}).is_ok());
  EXPECT_EQ(syslog.starts.load(), 2);
  EXPECT_EQ(syslog.stops.load(), 1);
  EXPECT_EQ(syslog.last_handle, second);
}
