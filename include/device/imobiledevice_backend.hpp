#pragma once

#include <libimobiledevice/libimobiledevice.h>
#include <libimobiledevice/lockdown.h>
#include <libimobiledevice/syslog_relay.h>

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <atomic>
#include <mutex>
#include <string>

#include "device/device_backend.hpp"

namespace carrierctrl {
namespace device {

// Service label announced to lockdownd for every client we open.
inline constexpr const char *kServiceLabel = "carrierctrl";

/**
 * An opened device plus its lockdown session.
 * Lockdown is not safe for concurrent use, get_value() serializes.
 */
class IMobileDeviceHandle : public IDeviceHandle {
public:
  IMobileDeviceHandle(idevice_t device, lockdownd_client_t lockdown,
                      std::string udid);
  ~IMobileDeviceHandle() override;

  IMobileDeviceHandle(const IMobileDeviceHandle &) = delete;
  IMobileDeviceHandle &operator=(const IMobileDeviceHandle &) = delete;

  std::string udid() const override { return udid_; }
  std::optional<std::string>
  get_value(const std::string &key, const std::string &domain) const override;

  idevice_t device() const { return device_; }

private:
  idevice_t device_;
  lockdownd_client_t lockdown_;
  std::string udid_;
  mutable std::mutex mutex_;
};

class IMobileDeviceConnector : public IDeviceConnector {
public:
  DeviceHandlePtr connect_first() override;

private:
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

// usbmuxd presence notifications. Network attached devices are ignored.
class IMobileDevicePresenceSource : public IPresenceSource {
public:
  ~IMobileDevicePresenceSource() override;

  std::optional<Error> subscribe(Handler handler) override;

private:
  static void on_event(const idevice_event_t *event, void *user_data);

  Handler handler_;
  std::atomic<bool> subscribed_{false};
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

// syslog_relay capture. The service hands over single characters, they are
// assembled into lines here.
class IMobileDeviceSyslogSource : public ISyslogSource {
public:
  ~IMobileDeviceSyslogSource() override;

  std::optional<Error> start(const DeviceHandlePtr &handle,
                             LineHandler on_line) override;
  void stop() override;

private:
  static void on_char(char c, void *user_data);

  std::mutex mutex_;
  syslog_relay_client_t client_{nullptr};

  std::mutex line_mutex_;
  std::string buffer_;
  LineHandler on_line_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

// Uploads the bundle over AFC into the staging directory, then asks the
// installation proxy to install it as the configured package type.
class IMobileDeviceInstaller : public IBundleInstaller {
public:
  std::optional<Error> install(const DeviceHandlePtr &handle,
                               const std::filesystem::path &bundle,
                               const InstallOptions &options,
                               ProgressHandler on_progress) override;

private:
  std::optional<Error> upload(idevice_t device,
                              const std::filesystem::path &bundle,
                              const std::string &remote_dir,
                              const std::string &remote_path);

  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace device
} // namespace carrierctrl
