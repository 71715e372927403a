#pragma once

#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "device/device_backend.hpp"
#include "notify/outcome_notifier.hpp"

namespace testinfra {

using namespace carrierctrl;

// Attribute store keyed by (domain, key).
class FakeDeviceHandle : public device::IDeviceHandle {
  std::string udid_;
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, std::string> values_;
  mutable std::map<std::string, int> hits_;
  std::string throw_on_;

public:
  explicit FakeDeviceHandle(std::string udid = "00008110-000A1B2C3D4E")
      : udid_(std::move(udid)) {}

  void set(const std::string &key, const std::string &value,
           const std::string &domain = device::domains::kAll) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[{domain, key}] = value;
  }

  void throw_on(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_on_ = key;
  }

  int hits(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hits_.find(key);
    return it == hits_.end() ? 0 : it->second;
  }

  std::string udid() const override { return udid_; }

  std::optional<std::string>
  get_value(const std::string &key, const std::string &domain) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    hits_[key]++;
    if (key == throw_on_) {
      throw std::runtime_error("lockdown went away");
    }
    auto it = values_.find({domain, key});
    if (it == values_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  // A device answering every summary key.
  static std::shared_ptr<FakeDeviceHandle>
  iphone(const std::string &model = "iPhone14,5",
         const std::string &version = "17.4.1") {
    auto h = std::make_shared<FakeDeviceHandle>();
    h->set(device::keys::kProductType, model);
    h->set(device::keys::kProductVersion, version);
    h->set(device::keys::kBuildVersion, "21E236");
    h->set(device::keys::kModelNumber, "MLPF3");
    h->set(device::keys::kRegionInfo, "LL/A");
    h->set(device::keys::kTotalDiskCapacity, "128000000000",
           device::domains::kDiskUsage);
    h->set(device::keys::kTotalDataAvailable, "28000000000",
           device::domains::kDiskUsage);
    h->set(device::keys::kBatteryCurrentCapacity, "87",
           device::domains::kBattery);
    h->set(device::keys::kBatteryMaximumCapacityPercent, "91",
           device::domains::kBattery);
    h->set(device::keys::kCycleCount, "312", device::domains::kBattery);
    return h;
  }
};

class FakeConnector : public device::IDeviceConnector {
public:
  device::DeviceHandlePtr handle;
  std::atomic<int> calls{0};

  device::DeviceHandlePtr connect_first() override {
    ++calls;
    return handle;
  }
};

class FakePresenceSource : public device::IPresenceSource {
public:
  Handler handler;
  std::optional<Error> fail_with;

  std::optional<Error> subscribe(Handler h) override {
    if (fail_with) {
      return fail_with;
    }
    handler = std::move(h);
    return std::nullopt;
  }

  void fire(device::PresenceEvent event) {
    if (handler) {
      handler(event);
    }
  }
};

class FakeSyslogSource : public device::ISyslogSource {
  mutable std::mutex mutex_;
  LineHandler handler_;

public:
  std::atomic<int> starts{0};
  std::atomic<int> stops{0};
  std::optional<Error> fail_with;
  device::DeviceHandlePtr last_handle;

  std::optional<Error> start(const device::DeviceHandlePtr &handle,
                             LineHandler on_line) override {
    if (fail_with) {
      return fail_with;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++starts;
    last_handle = handle;
    handler_ = std::move(on_line);
    return std::nullopt;
  }

  void stop() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handler_) {
      ++stops;
    }
    handler_ = nullptr;
  }

  bool running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(handler_);
  }

  // Feeds one line as if the device logged it.
  void emit(const std::string &line) {
    LineHandler h;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      h = handler_;
    }
    if (h) {
      h(line);
    }
  }
};

class FakeInstaller : public device::IBundleInstaller {
public:
  std::vector<std::string> progress;
  std::optional<Error> result;
  std::atomic<int> calls{0};
  device::InstallOptions last_options;
  std::filesystem::path last_bundle;

  std::optional<Error> install(const device::DeviceHandlePtr &,
                               const std::filesystem::path &bundle,
                               const device::InstallOptions &options,
                               ProgressHandler on_progress) override {
    ++calls;
    last_bundle = bundle;
    last_options = options;
    for (const auto &p : progress) {
      on_progress(p);
    }
    return result;
  }
};

class RecordingNotifier : public notify::IOutcomeNotifier {
  mutable std::mutex mutex_;
  std::condition_variable cv_;

public:
  struct Event {
    std::string name;
    boost::json::value payload;
  };
  std::vector<Event> events;
  bool fail{false};

  void emit(const std::string &event_name,
            const boost::json::value &payload) override {
    if (fail) {
      throw std::runtime_error("gui window closed");
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      events.push_back({event_name, payload});
    }
    cv_.notify_all();
  }

  std::vector<Event> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events;
  }

  std::vector<boost::json::value> payloads(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<boost::json::value> out;
    for (const auto &e : events) {
      if (e.name == name) {
        out.push_back(e.payload);
      }
    }
    return out;
  }

  std::vector<std::string> names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto &e : events) {
      out.push_back(e.name);
    }
    return out;
  }

  bool wait_for_count(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return events.size() >= n; });
  }
};

} // namespace testinfra
