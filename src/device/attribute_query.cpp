#include "device/attribute_query.hpp"

#include <boost/log/sources/record_ostream.hpp>

#include <exception>
#include <utility>

namespace carrierctrl {
namespace device {

namespace json = boost::json;
namespace trivial = boost::log::trivial;

AttributeQuery::AttributeQuery(DeviceHandlePtr handle)
    : handle_(std::move(handle)) {}

std::optional<std::string>
AttributeQuery::get(const std::string &key, const std::string &domain) const {
  if (!handle_) {
    return std::nullopt;
  }
  try {
    auto value = handle_->get_value(key, domain);
    if (!value) {
      BOOST_LOG_SEV(lg_, trivial::trace)
          << "Attribute unavailable: domain='" << domain << "' key=" << key;
    }
    return value;
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Attribute query failed: key=" << key << " error=" << e.what();
    return std::nullopt;
  }
}

std::optional<std::uint64_t>
AttributeQuery::get_number(const std::string &key,
                           const std::string &domain) const {
  auto text = get(key, domain);
  if (!text || text->empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    auto value = std::stoull(*text, &consumed);
    if (consumed != text->size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Attribute " << key << " is not numeric: " << *text;
    return std::nullopt;
  }
}

IdentitySnapshot AttributeQuery::identity() const {
  IdentitySnapshot snapshot;
  snapshot.model = get(keys::kProductType);
  snapshot.firmware_version = get(keys::kProductVersion);
  return snapshot;
}

std::optional<json::object> AttributeQuery::hardware_summary() const {
  auto model = get(keys::kProductType);
  if (!model) {
    return std::nullopt;
  }
  json::object obj;
  obj["model"] = *model;
  obj["model_number"] = get(keys::kModelNumber).value_or("");
  obj["region"] = get(keys::kRegionInfo).value_or("");
  return obj;
}

std::optional<json::object> AttributeQuery::storage_summary() const {
  auto total = get_number(keys::kTotalDiskCapacity, domains::kDiskUsage);
  auto available = get_number(keys::kTotalDataAvailable, domains::kDiskUsage);
  if (!total || !available) {
    return std::nullopt;
  }
  json::object obj;
  obj["total_storage"] = *total;
  obj["used_storage"] = *total >= *available ? *total - *available : 0;
  obj["available_storage"] = *available;
  return obj;
}

std::optional<json::object> AttributeQuery::battery_summary() const {
  auto level = get_number(keys::kBatteryCurrentCapacity, domains::kBattery);
  if (!level) {
    return std::nullopt;
  }
  json::object obj;
  obj["battery_level"] = *level;
  // Older firmware does not publish health or cycles through lockdown.
  obj["battery_health"] =
      get_number(keys::kBatteryMaximumCapacityPercent, domains::kBattery)
          .value_or(0);
  obj["cycle_counts"] =
      get_number(keys::kCycleCount, domains::kBattery).value_or(0);
  return obj;
}

std::optional<json::object> AttributeQuery::os_summary() const {
  auto version = get(keys::kProductVersion);
  if (!version) {
    return std::nullopt;
  }
  json::object obj;
  obj["ios_ver"] = *version;
  obj["build_num"] = get(keys::kBuildVersion).value_or("");
  return obj;
}

} // namespace device
} // namespace carrierctrl
