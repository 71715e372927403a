#include "monitor/connection_monitor.hpp"

#include <boost/asio/post.hpp>
#include <boost/log/sources/record_ostream.hpp>

#include <array>
#include <exception>
#include <functional>
#include <future>
#include <utility>

#include "device/attribute_query.hpp"
#include "my_error_codes.hpp"

namespace carrierctrl {
namespace monitor {

namespace json = boost::json;
namespace trivial = boost::log::trivial;

namespace {
constexpr const char *kUnavailable = "unavailable";
}

ConnectionMonitor::ConnectionMonitor(boost::asio::io_context &ioc,
                                     boost::asio::thread_pool &pool,
                                     device::IPresenceSource &presence,
                                     device::IDeviceConnector &connector,
                                     device::DeviceSession &session,
                                     notify::IOutcomeNotifier &notifier)
    : strand_(boost::asio::make_strand(ioc)), pool_(pool), presence_(presence),
      connector_(connector), session_(session), notifier_(notifier) {}

std::optional<Error> ConnectionMonitor::subscribe() {
  emit(device::events::kDeviceStatus, json::value(false));

  auto err = presence_.subscribe(
      [weak = weak_from_this()](device::PresenceEvent event) {
        auto self = weak.lock();
        if (!self) {
          return;
        }
        boost::asio::post(self->strand_,
                          [self, event]() { self->handle_event(event); });
      });
  if (err) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Device event subscription failed: " << *err;
    if (err->code != my_errors::DEVICE::SUBSCRIPTION_FAILED) {
      return make_error(my_errors::DEVICE::SUBSCRIPTION_FAILED, err->what);
    }
    return err;
  }
  BOOST_LOG_SEV(lg_, trivial::info) << "Listening for device events";
  return std::nullopt;
}

void ConnectionMonitor::handle_event(device::PresenceEvent event) {
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Device event: " << device::to_string(event);
  switch (event) {
  case device::PresenceEvent::Connected:
    on_connected();
    break;
  case device::PresenceEvent::Disconnected:
    on_disconnected();
    break;
  case device::PresenceEvent::Paired:
    break;
  }
}

void ConnectionMonitor::on_connected() {
  device::DeviceHandlePtr handle;
  try {
    handle = connector_.connect_first();
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to open the connected device: " << e.what();
  }

  if (!handle) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Device connected but no handle could be opened";
    emit(device::events::kDeviceStatus, json::value(true));
    publish_unavailable_summaries();
    return;
  }

  session_.replace(handle);
  emit(device::events::kDeviceStatus, json::value(true));
  BOOST_LOG_SEV(lg_, trivial::info) << "Device connected: " << handle->udid();

  auto lease_r = session_.acquire();
  if (lease_r.is_err()) {
    publish_unavailable_summaries();
    return;
  }
  publish_summaries(lease_r.value());
}

void ConnectionMonitor::on_disconnected() {
  emit(device::events::kDeviceStatus, json::value(false));
  session_.release();
  BOOST_LOG_SEV(lg_, trivial::info) << "Device disconnected";
}

void ConnectionMonitor::publish_summaries(
    const device::DeviceSession::Lease &lease) {
  using Summary = std::optional<json::object>;
  using Builder = Summary (device::AttributeQuery::*)() const;

  const std::array<std::pair<const char *, Builder>, 4> builders{{
      {device::events::kDeviceHardware,
       &device::AttributeQuery::hardware_summary},
      {device::events::kDeviceStorage, &device::AttributeQuery::storage_summary},
      {device::events::kDeviceBattery, &device::AttributeQuery::battery_summary},
      {device::events::kDeviceOs, &device::AttributeQuery::os_summary},
  }};

  device::AttributeQuery query(lease.handle);
  std::array<std::future<Summary>, 4> pending;
  for (std::size_t i = 0; i < builders.size(); ++i) {
    std::packaged_task<Summary()> task(
        [&query, builder = builders[i].second]() { return (query.*builder)(); });
    pending[i] = task.get_future();
    boost::asio::post(pool_, std::move(task));
  }

  for (std::size_t i = 0; i < builders.size(); ++i) {
    Summary summary;
    try {
      summary = pending[i].get();
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(lg_, trivial::warning)
          << builders[i].first << " query failed: " << e.what();
    }
    if (session_.validate(lease)) {
      BOOST_LOG_SEV(lg_, trivial::debug)
          << "Dropping " << builders[i].first << ", device went away";
      continue;
    }
    if (summary) {
      emit(builders[i].first, json::value(std::move(*summary)));
    } else {
      emit(builders[i].first, json::value(kUnavailable));
    }
  }
}

void ConnectionMonitor::publish_unavailable_summaries() {
  for (const char *event :
       {device::events::kDeviceHardware, device::events::kDeviceStorage,
        device::events::kDeviceBattery, device::events::kDeviceOs}) {
    emit(event, json::value(kUnavailable));
  }
}

void ConnectionMonitor::emit(const char *event, const json::value &payload) {
  notify::emit_logged(notifier_, lg_, event, payload);
}

} // namespace monitor
} // namespace carrierctrl
