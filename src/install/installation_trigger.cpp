#include "install/installation_trigger.hpp"

#include <boost/asio/post.hpp>
#include <boost/json.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <fmt/format.h>

#include <atomic>
#include <exception>
#include <filesystem>
#include <system_error>

#include "device/attribute_query.hpp"
#include "my_error_codes.hpp"

namespace carrierctrl {
namespace install {

namespace json = boost::json;
namespace trivial = boost::log::trivial;

namespace {

std::string_view trim_view(std::string_view sv) {
  constexpr std::string_view ws = " \t\r\n\"'{}";
  auto first = sv.find_first_not_of(ws);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = sv.find_last_not_of(ws);
  return sv.substr(first, last - first + 1);
}

} // namespace

std::vector<std::pair<std::string, std::string>>
parse_progress_fields(std::string_view text) {
  std::vector<std::pair<std::string, std::string>> fields;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto end = text.find_first_of("\n;,", pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto segment = text.substr(pos, end - pos);
    auto sep = segment.find_first_of(":=");
    if (sep != std::string_view::npos) {
      auto key = trim_view(segment.substr(0, sep));
      auto value = trim_view(segment.substr(sep + 1));
      if (!key.empty()) {
        fields.emplace_back(std::string(key), std::string(value));
      }
    }
    pos = end + 1;
  }
  return fields;
}

bool is_completion_marker(std::string_view progress,
                          const InstallerSettings &settings) {
  for (const auto &[key, value] : parse_progress_fields(progress)) {
    if (key == settings.completion_field &&
        value == settings.completion_value) {
      return true;
    }
  }
  return false;
}

InstallationTrigger::InstallationTrigger(boost::asio::thread_pool &pool,
                                         device::DeviceSession &session,
                                         device::IBundleInstaller &installer,
                                         notify::IOutcomeNotifier &notifier,
                                         InstallerSettings settings)
    : pool_(pool), session_(session), installer_(installer),
      notifier_(notifier), settings_(std::move(settings)) {}

void InstallationTrigger::install(device::InstallationRequest request,
                                  OutcomeCallback on_outcome) {
  auto self = shared_from_this();
  auto reported = std::make_shared<std::atomic<bool>>(false);
  std::function<bool(bool)> report =
      [self, reported, on_outcome = std::move(on_outcome)](bool installed) {
        if (reported->exchange(true)) {
          return false;
        }
        notify::emit_logged(self->notifier_, self->lg_,
                            device::events::kInstallStatus,
                            json::value(installed));
        if (on_outcome) {
          on_outcome(installed);
        }
        return true;
      };

  boost::asio::post(pool_, [self, request = std::move(request),
                            report = std::move(report)]() {
    try {
      self->run(request, report);
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(self->lg_, trivial::error)
          << "Installation aborted: " << e.what();
      report(false);
    }
  });
}

void InstallationTrigger::run(const device::InstallationRequest &request,
                              const std::function<bool(bool)> &report) {
  auto lease_r = session_.acquire();
  if (lease_r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Cannot install carrier bundle: " << lease_r.error().what;
    report(false);
    return;
  }
  auto lease = lease_r.value();

  // One snapshot per attempt; the comparison never re-queries.
  const auto snapshot = device::AttributeQuery(lease.handle).identity();
  if (!snapshot.matches(request.expected)) {
    BOOST_LOG_SEV(lg_, trivial::info) << fmt::format(
        "[{}] Model or iOS version mismatch: expected {}:{}, got {}:{}",
        my_errors::DEVICE::IDENTITY_MISMATCH, request.expected.model,
        request.expected.firmware_version,
        snapshot.model.value_or("<unknown>"),
        snapshot.firmware_version.value_or("<unknown>"));
    report(false);
    return;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(request.bundle_path, ec)) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Installation failed: [" << my_errors::INSTALL::START_FAILED
        << "] bundle is not a readable file: " << request.bundle_path;
    report(false);
    return;
  }

  if (auto stale = session_.validate(lease)) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Cannot install carrier bundle: " << stale->what;
    report(false);
    return;
  }

  const auto settings = settings_;
  auto err = installer_.install(
      lease.handle, request.bundle_path, settings.options,
      [this, &report, settings](const std::string &status) {
        BOOST_LOG_SEV(lg_, trivial::trace) << "Installer progress: " << status;
        if (is_completion_marker(status, settings)) {
          if (report(true)) {
            BOOST_LOG_SEV(lg_, trivial::info) << "Carrier bundle installed";
          }
        }
      });

  if (err) {
    BOOST_LOG_SEV(lg_, trivial::error) << "Installation failed: " << *err;
    report(false);
    return;
  }
  if (report(false)) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Installer returned without reporting "
        << settings.completion_field << ": " << settings.completion_value;
  } else {
    BOOST_LOG_SEV(lg_, trivial::debug) << "Installer call returned";
  }
}

} // namespace install
} // namespace carrierctrl
