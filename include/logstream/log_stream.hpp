#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "device/device_backend.hpp"
#include "device/device_session.hpp"
#include "logstream/pattern_filter.hpp"
#include "util/result.hpp"

namespace carrierctrl {
namespace logstream {

using SubscriptionHandle = std::uint64_t;

/**
 * Fan-out of the attached device's live syslog to registered filters.
 *
 * Lines pushed by the capture thread are queued on the stream's strand and
 * delivered to every active subscription in arrival order. A OneShot filter
 * is dropped right after it accepts its line. Capture starts with the first
 * subscription and stops when the last one is released.
 */
class LogStream : public std::enable_shared_from_this<LogStream> {
public:
  using LineCallback = std::function<void(const std::string &line)>;

  LogStream(boost::asio::io_context &ioc, device::ISyslogSource &source,
            device::DeviceSession &session);
  ~LogStream();

  // Errors: DEVICE::NO_DEVICE, LOGSTREAM::CAPTURE_FAILED.
  Result<SubscriptionHandle> subscribe(PatternFilterPtr filter,
                                       LineCallback on_line);

  // Idempotent: unknown or already released handles are ignored.
  void unsubscribe(SubscriptionHandle handle);

  // Entry point for the capture thread. Thread safe, never blocks.
  void push_line(std::string line);

  std::size_t active_subscriptions() const;
  bool capturing() const;

private:
  struct Subscription {
    PatternFilterPtr filter;
    LineCallback on_line;
  };

  void deliver(const std::string &line);
  std::optional<Error> ensure_capture_locked();
  void stop_capture_if_idle_locked();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  device::ISyslogSource &source_;
  device::DeviceSession &session_;

  mutable std::mutex mutex_;
  std::map<SubscriptionHandle, Subscription> subscriptions_;
  SubscriptionHandle next_handle_{1};
  bool capturing_{false};
  std::uint64_t capture_generation_{0};
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace logstream
} // namespace carrierctrl
