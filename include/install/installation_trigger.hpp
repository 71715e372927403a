#pragma once

#include <boost/asio/thread_pool.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "device/device_backend.hpp"
#include "device/device_session.hpp"
#include "notify/outcome_notifier.hpp"

namespace carrierctrl {
namespace install {

struct InstallerSettings {
  // The installer reports success with a "<field>: <value>" pair.
  std::string completion_field{"Status"};
  std::string completion_value{"Completed"};
  device::InstallOptions options{};
};

// Splits free form progress text into key/value fields. Fields are separated
// by newlines, ';' or ','; key and value by ':' or '='. Both are trimmed.
std::vector<std::pair<std::string, std::string>>
parse_progress_fields(std::string_view text);

// True only for an exact key and exact value match, never a substring.
bool is_completion_marker(std::string_view progress,
                          const InstallerSettings &settings);

/**
 * Installs a carrier bundle on the attached device, off the caller's thread.
 *
 * Every install() ends in exactly one carrier_bundle_install_status outcome:
 * true on the first completion marker, false for no device, identity
 * mismatch, installer start failure, or an installer that returns without
 * ever reporting completion. Nothing is retried.
 */
class InstallationTrigger
    : public std::enable_shared_from_this<InstallationTrigger> {
public:
  using OutcomeCallback = std::function<void(bool installed)>;

  InstallationTrigger(boost::asio::thread_pool &pool,
                      device::DeviceSession &session,
                      device::IBundleInstaller &installer,
                      notify::IOutcomeNotifier &notifier,
                      InstallerSettings settings);

  void install(device::InstallationRequest request,
               OutcomeCallback on_outcome = {});

private:
  void run(const device::InstallationRequest &request,
           const std::function<bool(bool)> &report);

  boost::asio::thread_pool &pool_;
  device::DeviceSession &session_;
  device::IBundleInstaller &installer_;
  notify::IOutcomeNotifier &notifier_;
  InstallerSettings settings_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace install
} // namespace carrierctrl
