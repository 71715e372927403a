#include "logstream/log_stream.hpp"

#include <boost/asio/post.hpp>
#include <boost/log/sources/record_ostream.hpp>

#include <exception>
#include <utility>
#include <vector>

#include "my_error_codes.hpp"

namespace carrierctrl {
namespace logstream {

namespace trivial = boost::log::trivial;

LogStream::LogStream(boost::asio::io_context &ioc,
                     device::ISyslogSource &source,
                     device::DeviceSession &session)
    : strand_(boost::asio::make_strand(ioc)), source_(source),
      session_(session) {}

LogStream::~LogStream() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (capturing_) {
    source_.stop();
    capturing_ = false;
  }
}

Result<SubscriptionHandle> LogStream::subscribe(PatternFilterPtr filter,
                                                LineCallback on_line) {
  using R = Result<SubscriptionHandle>;
  if (!filter) {
    return R::Err(make_error(my_errors::LOGSTREAM::FILTER_CONSTRUCTION,
                             "Cannot subscribe a null filter."));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto err = ensure_capture_locked()) {
    return R::Err(std::move(*err));
  }
  auto handle = next_handle_++;
  subscriptions_.emplace(handle,
                         Subscription{std::move(filter), std::move(on_line)});
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Log subscription " << handle << " added, active="
      << subscriptions_.size();
  return R::Ok(handle);
}

void LogStream::unsubscribe(SubscriptionHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscriptions_.find(handle);
  if (it == subscriptions_.end()) {
    return;
  }
  it->second.filter->deactivate();
  subscriptions_.erase(it);
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Log subscription " << handle << " released, active="
      << subscriptions_.size();
  stop_capture_if_idle_locked();
}

void LogStream::push_line(std::string line) {
  boost::asio::post(strand_, [weak = weak_from_this(),
                              line = std::move(line)]() {
    if (auto self = weak.lock()) {
      self->deliver(line);
    }
  });
}

std::size_t LogStream::active_subscriptions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

bool LogStream::capturing() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capturing_;
}

void LogStream::deliver(const std::string &line) {
  std::vector<std::pair<SubscriptionHandle, Subscription>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(subscriptions_.size());
    for (const auto &entry : subscriptions_) {
      snapshot.emplace_back(entry.first, entry.second);
    }
  }

  for (auto &[handle, sub] : snapshot) {
    if (!sub.filter->offer(line)) {
      continue;
    }
    if (sub.filter->mode() == FilterMode::OneShot) {
      unsubscribe(handle);
    }
    if (!sub.on_line) {
      continue;
    }
    try {
      sub.on_line(line);
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "Log subscriber " << handle << " threw: " << e.what();
    }
  }
}

std::optional<Error> LogStream::ensure_capture_locked() {
  auto lease_r = session_.acquire();
  if (lease_r.is_err()) {
    return lease_r.error();
  }
  const auto &lease = lease_r.value();
  if (capturing_ && capture_generation_ == lease.generation) {
    return std::nullopt;
  }
  if (capturing_) {
    // The device went away and came back since capture started.
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Restarting syslog capture for a new device session";
    source_.stop();
    capturing_ = false;
  }

  auto err = source_.start(lease.handle,
                           [weak = weak_from_this()](std::string line) {
                             if (auto self = weak.lock()) {
                               self->push_line(std::move(line));
                             }
                           });
  if (err) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to start syslog capture: " << err->what;
    return make_error(my_errors::LOGSTREAM::CAPTURE_FAILED, err->what);
  }
  capturing_ = true;
  capture_generation_ = lease.generation;
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Syslog capture started for " << lease.handle->udid();
  return std::nullopt;
}

void LogStream::stop_capture_if_idle_locked() {
  if (!subscriptions_.empty() || !capturing_) {
    return;
  }
  source_.stop();
  capturing_ = false;
  BOOST_LOG_SEV(lg_, trivial::info) << "Syslog capture stopped, no subscribers";
}

} // namespace logstream
} // namespace carrierctrl
