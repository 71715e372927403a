#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <memory>
#include <optional>

#include "device/device_backend.hpp"
#include "device/device_session.hpp"
#include "notify/outcome_notifier.hpp"
#include "util/result.hpp"

namespace carrierctrl {
namespace monitor {

/**
 * Turns presence events into device_status and the four summary events.
 *
 * Events are handled one at a time on the monitor's strand, in the order the
 * presence source delivered them. On connect the session handle is replaced
 * and device_status=true goes out before any summary; the summaries are
 * queried concurrently on the worker pool and each is dropped if the device
 * went away in the meantime. On disconnect device_status=false goes out and
 * the handle is released.
 */
class ConnectionMonitor
    : public std::enable_shared_from_this<ConnectionMonitor> {
public:
  ConnectionMonitor(boost::asio::io_context &ioc,
                    boost::asio::thread_pool &pool,
                    device::IPresenceSource &presence,
                    device::IDeviceConnector &connector,
                    device::DeviceSession &session,
                    notify::IOutcomeNotifier &notifier);

  /**
   * Publishes device_status=false, then starts listening.
   * Errors: DEVICE::SUBSCRIPTION_FAILED. No event is delivered afterwards.
   */
  std::optional<Error> subscribe();

private:
  void handle_event(device::PresenceEvent event);
  void on_connected();
  void on_disconnected();
  void publish_summaries(const device::DeviceSession::Lease &lease);
  void publish_unavailable_summaries();
  void emit(const char *event, const boost::json::value &payload);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::thread_pool &pool_;
  device::IPresenceSource &presence_;
  device::IDeviceConnector &connector_;
  device::DeviceSession &session_;
  notify::IOutcomeNotifier &notifier_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace monitor
} // namespace carrierctrl
