#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "install/completion_race.hpp"
#include "logstream/log_stream.hpp"
#include "logstream/pattern_filter.hpp"
#include "notify/outcome_notifier.hpp"

namespace carrierctrl {
namespace install {

struct InstallCheckSettings {
  logstream::FilterOptions filter{"SIM is ready",
                                  logstream::FilterMode::OneShot,
                                  logstream::MatchSyntax::Substring,
                                  logstream::FilterScope::All, false};
  std::chrono::milliseconds timeout{std::chrono::seconds(40)};
};

/**
 * Post-install verification: waits for the device to log that the SIM came
 * back and publishes installation_succeed_status once, true on a match and
 * false on timeout or when the watch cannot be set up at all.
 */
class InstallationChecker {
public:
  using OutcomeCallback = std::function<void(bool succeeded)>;

  InstallationChecker(boost::asio::io_context &ioc, logstream::LogStream &stream,
                      notify::IOutcomeNotifier &notifier,
                      InstallCheckSettings settings);

  // Returns the race so callers may observe it. The checker must outlive
  // every race it started. `timeout` overrides the configured deadline.
  std::shared_ptr<CompletionRace>
  check(OutcomeCallback on_outcome = {},
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  const InstallCheckSettings &settings() const { return settings_; }

private:
  void publish(bool succeeded, const OutcomeCallback &on_outcome);

  boost::asio::io_context &ioc_;
  logstream::LogStream &stream_;
  notify::IOutcomeNotifier &notifier_;
  InstallCheckSettings settings_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace install
} // namespace carrierctrl
