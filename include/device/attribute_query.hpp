#pragma once

#include <boost/json.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include "device/device_backend.hpp"

namespace carrierctrl {
namespace device {

// The pair compared against an ExpectedIdentity. Taken once per install
// attempt and never refreshed while the comparison runs.
struct IdentitySnapshot {
  std::optional<std::string> model;
  std::optional<std::string> firmware_version;

  bool matches(const ExpectedIdentity &expected) const {
    return model && firmware_version && *model == expected.model &&
           *firmware_version == expected.firmware_version;
  }
};

/**
 * Named attribute lookups against one device handle.
 *
 * Never throws: anything the backend raises is logged and turned into an
 * absent value. The summary builders return nullopt when a mandatory key is
 * missing so the caller can publish "unavailable" for that summary alone.
 */
class AttributeQuery {
public:
  explicit AttributeQuery(DeviceHandlePtr handle);

  std::optional<std::string> get(const std::string &key,
                                 const std::string &domain = domains::kAll) const;

  IdentitySnapshot identity() const;

  // {model, model_number, region}
  std::optional<boost::json::object> hardware_summary() const;
  // {total_storage, used_storage, available_storage}, bytes
  std::optional<boost::json::object> storage_summary() const;
  // {battery_level, battery_health, cycle_counts}
  std::optional<boost::json::object> battery_summary() const;
  // {ios_ver, build_num}
  std::optional<boost::json::object> os_summary() const;

private:
  std::optional<std::uint64_t> get_number(const std::string &key,
                                          const std::string &domain) const;

  DeviceHandlePtr handle_;
  mutable boost::log::sources::severity_logger_mt<
      boost::log::trivial::severity_level>
      lg_;
};

} // namespace device
} // namespace carrierctrl
