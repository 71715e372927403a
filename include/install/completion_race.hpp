#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "logstream/log_stream.hpp"
#include "logstream/pattern_filter.hpp"
#include "util/result.hpp"

namespace carrierctrl {
namespace install {

/**
 * Races a one-shot log match against a deadline.
 *
 * Idle -> Armed on arm(); Armed -> Resolved exactly once, by whichever of the
 * match path and the timer path wins the atomic exchange on state_. Only the
 * winner runs its callback; it then cancels the other path (timer cancel, or
 * filter release). Resolved is final, a new race needs a new instance.
 *
 * Lifetime: must be owned by a std::shared_ptr; pending handlers keep it alive
 * until the race resolves.
 */
class CompletionRace : public std::enable_shared_from_this<CompletionRace> {
public:
  enum class State { Idle, Armed, Resolved };

  using MatchedCallback = std::function<void(const std::string &line)>;
  using TimedOutCallback = std::function<void()>;

  CompletionRace(boost::asio::io_context &ioc, logstream::LogStream &stream);

  /**
   * Subscribe the filter and start the deadline.
   * On error no callback will ever run and the race is Resolved (or stays
   * Idle for a second arm() on an already armed race).
   * Errors: LOGSTREAM::RACE_ALREADY_ARMED, LOGSTREAM::FILTER_CONSTRUCTION for
   * a non one-shot filter, and whatever LogStream::subscribe reports.
   */
  std::optional<Error> arm(logstream::PatternFilterPtr filter,
                           std::chrono::milliseconds timeout,
                           MatchedCallback on_matched,
                           TimedOutCallback on_timed_out);

  State state() const { return state_.load(); }

private:
  bool try_resolve();
  void on_line(const std::string &line);
  void on_deadline();
  void release_subscription();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  logstream::LogStream &stream_;
  std::atomic<State> state_{State::Idle};

  std::mutex mutex_;
  std::optional<logstream::SubscriptionHandle> subscription_;
  MatchedCallback on_matched_;
  TimedOutCallback on_timed_out_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace install
} // namespace carrierctrl
