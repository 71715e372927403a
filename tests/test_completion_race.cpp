#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <random>
#include <thread>
#include <vector>

#include "device_fakes.hpp"
#include "install/completion_race.hpp"
#include "my_error_codes.hpp"
#include "util/io_context_manager.hpp"

using namespace carrierctrl;
using namespace std::chrono_literals;
using install::CompletionRace;

namespace {

constexpr const char *kSimReadyLine =
    "Mar  3 10:15:02 iPhone CommCenter(CoreTelephony)[81] <Notice>: SIM is "
    "ready";

logstream::PatternFilterPtr sim_ready_filter(
    logstream::FilterMode mode = logstream::FilterMode::OneShot) {
  logstream::FilterOptions options{"SIM is ready"};
  options.mode = mode;
  return logstream::PatternFilter::create(options).value();
}

} // namespace

class CompletionRaceTest : public ::testing::Test {
protected:
  void SetUp() override {
    stream = std::make_shared<logstream::LogStream>(io.ioc(), syslog, session);
  }

  void TearDown() override {
    io.stop();
    stream.reset();
  }

  void attach() { session.replace(testinfra::FakeDeviceHandle::iphone()); }

  testinfra::FakeSyslogSource syslog;
  device::DeviceSession session;
  IoContextManager io{4};
  std::shared_ptr<logstream::LogStream> stream;
};

TEST_F(CompletionRaceTest, MatchWinsAndTimerNeverFires) {
  attach();
  auto race = std::make_shared<CompletionRace>(io.ioc(), *stream);
  std::promise<std::string> matched;
  std::atomic<int> timeouts{0};

  auto err = race->arm(
      sim_ready_filter(), 300ms,
      [&](const std::string &line) { matched.set_value(line); },
      [&] { ++timeouts; });
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(race->state(), CompletionRace::State::Armed);

  syslog.emit("Mar  3 10:15:01 iPhone CommCenter[81] <Notice>: SIM busy");
  syslog.emit(kSimReadyLine);
  auto fut = matched.get_future();
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(fut.get(), kSimReadyLine);
  EXPECT_EQ(race->state(), CompletionRace::State::Resolved);

  std::this_thread::sleep_for(600ms);
  EXPECT_EQ(timeouts.load(), 0);
  EXPECT_EQ(stream->active_subscriptions(), 0u);
  EXPECT_FALSE(stream->capturing());
}

TEST_F(CompletionRaceTest, TimeoutWinsAndLateLinesAreIgnored) {
  attach();
  auto race = std::make_shared<CompletionRace>(io.ioc(), *stream);
  std::promise<std::chrono::steady_clock::time_point> timed_out;
  std::atomic<int> matches{0};
  const auto timeout = 100ms;

  const auto armed_at = std::chrono::steady_clock::now();
  auto err = race->arm(
      sim_ready_filter(), timeout, [&](const std::string &) { ++matches; },
      [&] { timed_out.set_value(std::chrono::steady_clock::now()); });
  ASSERT_FALSE(err.has_value());

  auto fut = timed_out.get_future();
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  EXPECT_GE(fut.get() - armed_at, timeout);
  EXPECT_EQ(race->state(), CompletionRace::State::Resolved);
  EXPECT_EQ(stream->active_subscriptions(), 0u);

  syslog.emit(kSimReadyLine);
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(matches.load(), 0);
}

TEST_F(CompletionRaceTest, ArmingTwiceIsRejected) {
  attach();
  auto race = std::make_shared<CompletionRace>(io.ioc(), *stream);
  ASSERT_FALSE(race->arm(sim_ready_filter(), 5s, {}, {}).has_value());
  auto err = race->arm(sim_ready_filter(), 5s, {}, {});
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::LOGSTREAM::RACE_ALREADY_ARMED);
  EXPECT_EQ(stream->active_subscriptions(), 1u);

  // Resolve it so nothing is left pending on the timer.
  syslog.emit(kSimReadyLine);
}

TEST_F(CompletionRaceTest, PersistentFilterIsRejected) {
  attach();
  auto race = std::make_shared<CompletionRace>(io.ioc(), *stream);
  auto err = race->arm(sim_ready_filter(logstream::FilterMode::Persistent),
                       5s, {}, {});
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::LOGSTREAM::FILTER_CONSTRUCTION);
  EXPECT_EQ(race->state(), CompletionRace::State::Resolved);
  EXPECT_EQ(stream->active_subscriptions(), 0u);
}

TEST_F(CompletionRaceTest, NoDeviceResolvesWithoutCallbacks) {
  auto race = std::make_shared<CompletionRace>(io.ioc(), *stream);
  std::atomic<int> calls{0};
  auto err = race->arm(
      sim_ready_filter(), 20ms, [&](const std::string &) { ++calls; },
      [&] { ++calls; });
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::DEVICE::NO_DEVICE);
  EXPECT_EQ(race->state(), CompletionRace::State::Resolved);

  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(calls.load(), 0);
}

TEST_F(CompletionRaceTest, ConcurrentMatchAndTimeoutResolveExactlyOnce) {
  attach();
  std::mt19937 gen{12345};
  std::uniform_int_distribution<int> jitter_us(0, 4000);

  constexpr int kRounds = 100;
  std::vector<std::shared_ptr<std::atomic<int>>> counters;
  for (int round = 0; round < kRounds; ++round) {
    auto count = std::make_shared<std::atomic<int>>(0);
    counters.push_back(count);
    auto race = std::make_shared<CompletionRace>(io.ioc(), *stream);
    auto err = race->arm(
        sim_ready_filter(), 2ms,
        [count](const std::string &) { ++*count; }, [count] { ++*count; });
    ASSERT_FALSE(err.has_value());

    auto delay = std::chrono::microseconds(jitter_us(gen));
    std::thread emitter([this, delay] {
      std::this_thread::sleep_for(delay);
      syslog.emit(kSimReadyLine);
    });
    emitter.join();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (race->state() != CompletionRace::State::Resolved &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(race->state(), CompletionRace::State::Resolved);
  }

  std::this_thread::sleep_for(200ms);
  for (int round = 0; round < kRounds; ++round) {
    EXPECT_EQ(counters[round]->load(), 1) << "round " << round;
  }
}
