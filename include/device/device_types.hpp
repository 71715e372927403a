#pragma once

#include <filesystem>
#include <string>

namespace carrierctrl {
namespace device {

enum class PresenceEvent { Connected, Disconnected, Paired };

inline const char *to_string(PresenceEvent event) {
  switch (event) {
  case PresenceEvent::Connected:
    return "connected";
  case PresenceEvent::Disconnected:
    return "disconnected";
  case PresenceEvent::Paired:
    return "paired";
  }
  return "unknown";
}

// What the caller believes the attached device is. Compared against a
// snapshot of the device's own answers before anything is installed.
struct ExpectedIdentity {
  std::string model;            // e.g. iPhone14,5
  std::string firmware_version; // e.g. 17.4.1
};

struct InstallationRequest {
  std::filesystem::path bundle_path;
  ExpectedIdentity expected;
};

// Lockdown keys queried through IDeviceHandle::get_value.
namespace keys {
inline constexpr const char *kProductType = "ProductType";
inline constexpr const char *kProductVersion = "ProductVersion";
inline constexpr const char *kBuildVersion = "BuildVersion";
inline constexpr const char *kModelNumber = "ModelNumber";
inline constexpr const char *kRegionInfo = "RegionInfo";
inline constexpr const char *kTotalDiskCapacity = "TotalDiskCapacity";
inline constexpr const char *kTotalDataAvailable = "TotalDataAvailable";
inline constexpr const char *kBatteryCurrentCapacity =
    "BatteryCurrentCapacity";
inline constexpr const char *kBatteryMaximumCapacityPercent =
    "BatteryMaximumCapacityPercent";
inline constexpr const char *kCycleCount = "CycleCount";
} // namespace keys

// An empty domain means the global lockdown domain.
namespace domains {
inline constexpr const char *kAll = "";
inline constexpr const char *kBattery = "com.apple.mobile.battery";
inline constexpr const char *kDiskUsage = "com.apple.disk_usage";
} // namespace domains

// Outbound event names consumed by the GUI shell.
namespace events {
inline constexpr const char *kDeviceStatus = "device_status";
inline constexpr const char *kDeviceHardware = "device_hardware";
inline constexpr const char *kDeviceStorage = "device_storage";
inline constexpr const char *kDeviceBattery = "device_battery";
inline constexpr const char *kDeviceOs = "device_os";
inline constexpr const char *kInstallStatus = "carrier_bundle_install_status";
inline constexpr const char *kInstallSucceedStatus =
    "installation_succeed_status";
} // namespace events

} // namespace device
} // namespace carrierctrl
