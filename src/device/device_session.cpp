#include "device/device_session.hpp"

#include <mutex>
#include <utility>

#include "my_error_codes.hpp"

namespace carrierctrl {
namespace device {

namespace trivial = boost::log::trivial;

void DeviceSession::replace(DeviceHandlePtr handle) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  handle_ = std::move(handle);
  ++generation_;
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Device session replaced, generation=" << generation_
      << " udid=" << (handle_ ? handle_->udid() : std::string("<none>"));
}

void DeviceSession::release() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!handle_) {
    return;
  }
  handle_.reset();
  ++generation_;
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Device session released, generation=" << generation_;
}

Result<DeviceSession::Lease> DeviceSession::acquire() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (!handle_) {
    return Result<Lease>::Err(
        make_error(my_errors::DEVICE::NO_DEVICE, "No device attached."));
  }
  return Result<Lease>::Ok(Lease{handle_, generation_});
}

std::optional<Error> DeviceSession::validate(const Lease &lease) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (!handle_ || !lease.handle || lease.generation != generation_ ||
      lease.handle != handle_) {
    return make_error(my_errors::DEVICE::NO_DEVICE,
                      "Device was disconnected or replaced.");
  }
  return std::nullopt;
}

bool DeviceSession::attached() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return handle_ != nullptr;
}

std::uint64_t DeviceSession::generation() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return generation_;
}

std::optional<Error> attach_if_absent(DeviceSession &session,
                                      IDeviceConnector &connector) {
  if (session.attached()) {
    return std::nullopt;
  }
  auto handle = connector.connect_first();
  if (!handle) {
    return make_error(my_errors::DEVICE::NO_DEVICE,
                      "No device could be opened.");
  }
  session.replace(std::move(handle));
  return std::nullopt;
}

} // namespace device
} // namespace carrierctrl
