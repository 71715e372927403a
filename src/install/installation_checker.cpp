#include "install/installation_checker.hpp"

#include <boost/json.hpp>
#include <boost/log/sources/record_ostream.hpp>

#include <utility>

#include "device/device_types.hpp"

namespace carrierctrl {
namespace install {

namespace trivial = boost::log::trivial;

InstallationChecker::InstallationChecker(boost::asio::io_context &ioc,
                                         logstream::LogStream &stream,
                                         notify::IOutcomeNotifier &notifier,
                                         InstallCheckSettings settings)
    : ioc_(ioc), stream_(stream), notifier_(notifier),
      settings_(std::move(settings)) {}

std::shared_ptr<CompletionRace>
InstallationChecker::check(OutcomeCallback on_outcome,
                           std::optional<std::chrono::milliseconds> timeout) {
  const auto deadline = timeout.value_or(settings_.timeout);
  auto race = std::make_shared<CompletionRace>(ioc_, stream_);

  auto options = settings_.filter;
  options.mode = logstream::FilterMode::OneShot;
  auto filter_r = logstream::PatternFilter::create(std::move(options));
  if (filter_r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Cannot watch for SIM readiness: " << filter_r.error();
    publish(false, on_outcome);
    return race;
  }

  auto err = race->arm(
      filter_r.value(), deadline,
      [this, on_outcome](const std::string &line) {
        BOOST_LOG_SEV(lg_, trivial::info) << "SIM ready: " << line;
        publish(true, on_outcome);
      },
      [this, on_outcome, deadline]() {
        BOOST_LOG_SEV(lg_, trivial::warning)
            << "No SIM ready message within " << deadline.count() << " ms";
        publish(false, on_outcome);
      });
  if (err) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Cannot watch for SIM readiness: " << *err;
    publish(false, on_outcome);
  }
  return race;
}

void InstallationChecker::publish(bool succeeded,
                                  const OutcomeCallback &on_outcome) {
  notify::emit_logged(notifier_, lg_, device::events::kInstallSucceedStatus,
                      boost::json::value(succeeded));
  if (on_outcome) {
    on_outcome(succeeded);
  }
}

} // namespace install
} // namespace carrierctrl
