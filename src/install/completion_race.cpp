#include "install/completion_race.hpp"

#include <boost/asio/post.hpp>
#include <boost/log/sources/record_ostream.hpp>

#include <exception>
#include <utility>

#include "my_error_codes.hpp"

namespace carrierctrl {
namespace install {

namespace trivial = boost::log::trivial;

CompletionRace::CompletionRace(boost::asio::io_context &ioc,
                               logstream::LogStream &stream)
    : strand_(boost::asio::make_strand(ioc)), timer_(strand_),
      stream_(stream) {}

std::optional<Error> CompletionRace::arm(logstream::PatternFilterPtr filter,
                                         std::chrono::milliseconds timeout,
                                         MatchedCallback on_matched,
                                         TimedOutCallback on_timed_out) {
  auto expected = State::Idle;
  if (!state_.compare_exchange_strong(expected, State::Armed)) {
    return make_error(my_errors::LOGSTREAM::RACE_ALREADY_ARMED,
                      "Completion race was already armed.");
  }
  if (!filter || filter->mode() != logstream::FilterMode::OneShot) {
    state_.store(State::Resolved);
    return make_error(my_errors::LOGSTREAM::FILTER_CONSTRUCTION,
                      "Completion race requires a one-shot filter.");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    on_matched_ = std::move(on_matched);
    on_timed_out_ = std::move(on_timed_out);
  }

  auto self = shared_from_this();
  auto sub_r = stream_.subscribe(
      filter, [weak = weak_from_this()](const std::string &line) {
        if (auto race = weak.lock()) {
          race->on_line(line);
        }
      });
  if (sub_r.is_err()) {
    state_.store(State::Resolved);
    std::lock_guard<std::mutex> lock(mutex_);
    on_matched_ = nullptr;
    on_timed_out_ = nullptr;
    return sub_r.error();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscription_ = sub_r.value();
  }
  if (state_.load() == State::Resolved) {
    // Matched before we even got here.
    release_subscription();
    return std::nullopt;
  }

  boost::asio::post(strand_, [self, timeout]() {
    if (self->state_.load() != State::Armed) {
      return;
    }
    self->timer_.expires_after(timeout);
    self->timer_.async_wait([self](const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      self->on_deadline();
    });
  });

  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Completion race armed: pattern='" << filter->options().pattern
      << "' timeout_ms=" << timeout.count();
  return std::nullopt;
}

bool CompletionRace::try_resolve() {
  auto expected = State::Armed;
  return state_.compare_exchange_strong(expected, State::Resolved);
}

void CompletionRace::on_line(const std::string &line) {
  if (!try_resolve()) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() { self->timer_.cancel(); });
  release_subscription();

  MatchedCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = std::move(on_matched_);
    on_timed_out_ = nullptr;
  }
  BOOST_LOG_SEV(lg_, trivial::info) << "Completion race matched: " << line;
  if (!cb) {
    return;
  }
  try {
    cb(line);
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Matched callback threw: " << e.what();
  }
}

void CompletionRace::on_deadline() {
  if (!try_resolve()) {
    return;
  }
  release_subscription();

  TimedOutCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = std::move(on_timed_out_);
    on_matched_ = nullptr;
  }
  BOOST_LOG_SEV(lg_, trivial::warning) << "Completion race timed out";
  if (!cb) {
    return;
  }
  try {
    cb();
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Timed-out callback threw: " << e.what();
  }
}

void CompletionRace::release_subscription() {
  std::optional<logstream::SubscriptionHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handle.swap(subscription_);
  }
  if (handle) {
    stream_.unsubscribe(*handle);
  }
}

} // namespace install
} // namespace carrierctrl
