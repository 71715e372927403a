#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "device_fakes.hpp"
#include "install/installation_checker.hpp"
#include "util/io_context_manager.hpp"

using namespace carrierctrl;
using namespace std::chrono_literals;

namespace {

constexpr const char *kSimReadyLine =
    "Mar  3 10:15:02 iPhone CommCenter(CoreTelephony)[81] <Notice>: SIM is "
    "ready";

} // namespace

class InstallationCheckerTest : public ::testing::Test {
protected:
  void SetUp() override {
    stream = std::make_shared<logstream::LogStream>(io.ioc(), syslog, session);
  }

  void TearDown() override {
    io.stop();
    stream.reset();
  }

  std::future<bool> run_check(install::InstallationChecker &checker,
                              std::optional<std::chrono::milliseconds>
                                  timeout = std::nullopt) {
    auto done = std::make_shared<std::promise<bool>>();
    auto fut = done->get_future();
    checker.check([done](bool ok) { done->set_value(ok); }, timeout);
    return fut;
  }

  testinfra::FakeSyslogSource syslog;
  testinfra::RecordingNotifier notifier;
  device::DeviceSession session;
  IoContextManager io{2};
  std::shared_ptr<logstream::LogStream> stream;
};

TEST_F(InstallationCheckerTest, DefaultsWatchForSimReady) {
  install::InstallCheckSettings defaults;
  EXPECT_EQ(defaults.filter.pattern, "SIM is ready");
  EXPECT_FALSE(defaults.filter.case_sensitive);
  EXPECT_EQ(defaults.filter.scope, logstream::FilterScope::All);
  EXPECT_EQ(defaults.timeout, 40s);
}

TEST_F(InstallationCheckerTest, SimReadyPublishesSuccess) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  install::InstallationChecker checker(io.ioc(), *stream, notifier, {});
  auto fut = run_check(checker);

  syslog.emit("Mar  3 10:15:00 iPhone kernel[0] <Notice>: booting");
  syslog.emit("mar  3 10:15:02 iphone commcenter[81] <notice>: sim IS READY");
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(fut.get());

  auto published = notifier.payloads(device::events::kInstallSucceedStatus);
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0], boost::json::value(true));
}

TEST_F(InstallationCheckerTest, SilenceUntilDeadlinePublishesFailure) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  install::InstallationChecker checker(io.ioc(), *stream, notifier, {});
  const auto timeout = 100ms;
  std::promise<std::chrono::steady_clock::time_point> finished;
  auto finished_at = finished.get_future();
  std::atomic<bool> outcome{true};

  const auto started_at = std::chrono::steady_clock::now();
  checker.check(
      [&](bool ok) {
        outcome = ok;
        finished.set_value(std::chrono::steady_clock::now());
      },
      timeout);

  ASSERT_EQ(finished_at.wait_for(2s), std::future_status::ready);
  EXPECT_GE(finished_at.get() - started_at, timeout);
  EXPECT_FALSE(outcome.load());

  // A late match does not publish a second outcome.
  syslog.emit(kSimReadyLine);
  std::this_thread::sleep_for(100ms);
  auto published = notifier.payloads(device::events::kInstallSucceedStatus);
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0], boost::json::value(false));
}

TEST_F(InstallationCheckerTest, NoDevicePublishesFailureImmediately) {
  install::InstallationChecker checker(io.ioc(), *stream, notifier, {});
  auto fut = run_check(checker);
  ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
  EXPECT_FALSE(fut.get());
  EXPECT_EQ(notifier.payloads(device::events::kInstallSucceedStatus).size(),
            1u);
}

TEST_F(InstallationCheckerTest, InvalidPatternPublishesFailure) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  install::InstallCheckSettings settings;
  settings.filter.pattern = "SIM (";
  settings.filter.syntax = logstream::MatchSyntax::Regex;
  install::InstallationChecker checker(io.ioc(), *stream, notifier, settings);
  auto fut = run_check(checker);
  ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
  EXPECT_FALSE(fut.get());
  EXPECT_EQ(syslog.starts.load(), 0);
}

TEST_F(InstallationCheckerTest, PersistentSettingIsForcedToOneShot) {
  session.replace(testinfra::FakeDeviceHandle::iphone());
  install::InstallCheckSettings settings;
  settings.filter.pattern = "Carrier settings updated";
  settings.filter.mode = logstream::FilterMode::Persistent;
  settings.filter.scope = logstream::FilterScope::Message;
  install::InstallationChecker checker(io.ioc(), *stream, notifier, settings);
  auto fut = run_check(checker);

  syslog.emit(
      "Mar  3 10:15:02 iPhone CommCenter[81] <Notice>: Carrier settings "
      "updated");
  syslog.emit(
      "Mar  3 10:15:03 iPhone CommCenter[81] <Notice>: Carrier settings "
      "updated");
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(fut.get());
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(notifier.payloads(device::events::kInstallSucceedStatus).size(),
            1u);
  EXPECT_EQ(stream->active_subscriptions(), 0u);
}
