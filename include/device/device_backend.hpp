#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "device/device_types.hpp"
#include "util/result.hpp"

namespace carrierctrl {
namespace device {

/**
 * Capability for talking to the currently attached device.
 * Owned by DeviceSession; components only ever hold it through a lease.
 */
class IDeviceHandle {
public:
  virtual ~IDeviceHandle() = default;

  virtual std::string udid() const = 0;

  /**
   * Query a single attribute.
   * @return the value rendered as text, or nullopt for unknown or unsupported
   *         keys. Must not block indefinitely.
   */
  virtual std::optional<std::string>
  get_value(const std::string &key, const std::string &domain) const = 0;
};

using DeviceHandlePtr = std::shared_ptr<IDeviceHandle>;

class IDeviceConnector {
public:
  virtual ~IDeviceConnector() = default;
  // Opens a fresh handle to the first attached device, nullptr if none.
  virtual DeviceHandlePtr connect_first() = 0;
};

class IPresenceSource {
public:
  using Handler = std::function<void(PresenceEvent)>;
  virtual ~IPresenceSource() = default;
  // Delivers events until process exit. Errors carry
  // my_errors::DEVICE::SUBSCRIPTION_FAILED.
  virtual std::optional<Error> subscribe(Handler handler) = 0;
};

class ISyslogSource {
public:
  using LineHandler = std::function<void(std::string line)>;
  virtual ~ISyslogSource() = default;
  virtual std::optional<Error> start(const DeviceHandlePtr &handle,
                                     LineHandler on_line) = 0;
  // Idempotent.
  virtual void stop() = 0;
};

struct InstallOptions {
  std::string package_type{"CarrierBundle"};
  std::string staging_dir{"PublicStaging"};
  // Upper bound on waiting for the device installer to finish.
  std::chrono::seconds completion_timeout{std::chrono::minutes(10)};
};

class IBundleInstaller {
public:
  using ProgressHandler = std::function<void(const std::string &status)>;
  virtual ~IBundleInstaller() = default;
  /**
   * Blocks until the device installer finishes or fails.
   * Progress text is free form, usually "Status: <name>" style fields.
   */
  virtual std::optional<Error> install(const DeviceHandlePtr &handle,
                                       const std::filesystem::path &bundle,
                                       const InstallOptions &options,
                                       ProgressHandler on_progress) = 0;
};

} // namespace device
} // namespace carrierctrl
