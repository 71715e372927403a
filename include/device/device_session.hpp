#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <cstdint>
#include <optional>
#include <shared_mutex>

#include "device/device_backend.hpp"
#include "util/result.hpp"

namespace carrierctrl {
namespace device {

/**
 * Holds "the currently attached device".
 *
 * Single writer (the connection monitor, or a one-shot command attaching on
 * its own), many readers. The handle is replaced on every connect and dropped
 * on disconnect; each change bumps a generation number so a lease taken
 * before a disconnect can be detected as stale.
 */
class DeviceSession {
public:
  struct Lease {
    DeviceHandlePtr handle;
    std::uint64_t generation{0};
  };

  // Installs a fresh handle for a newly connected device.
  void replace(DeviceHandlePtr handle);

  // Drops the handle after a disconnect. No-op when nothing is attached.
  void release();

  // Errors with my_errors::DEVICE::NO_DEVICE when nothing is attached.
  Result<Lease> acquire() const;

  // Re-validates a lease before use. NO_DEVICE when it went stale.
  std::optional<Error> validate(const Lease &lease) const;

  bool attached() const;
  std::uint64_t generation() const;

private:
  mutable std::shared_mutex mutex_;
  DeviceHandlePtr handle_;
  std::uint64_t generation_{0};
  boost::log::sources::severity_logger<boost::log::trivial::severity_level>
      lg_;
};

// For one-shot commands that run without the connection monitor: opens the
// first attached device when the session is empty. NO_DEVICE if none.
std::optional<Error> attach_if_absent(DeviceSession &session,
                                      IDeviceConnector &connector);

} // namespace device
} // namespace carrierctrl
