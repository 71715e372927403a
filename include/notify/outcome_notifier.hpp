#pragma once

#include <boost/json.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <exception>
#include <mutex>
#include <ostream>
#include <string>

namespace carrierctrl {
namespace notify {

/**
 * Sink for user facing outcomes. In the desktop deployment this is the GUI
 * event emitter; the core treats it as opaque and fire-and-forget.
 */
class IOutcomeNotifier {
public:
  virtual ~IOutcomeNotifier() = default;
  virtual void emit(const std::string &event_name,
                    const boost::json::value &payload) = 0;
};

// Emits and swallows sink failures after logging them. Never retries.
template <typename Logger>
void emit_logged(IOutcomeNotifier &notifier, Logger &lg,
                 const std::string &event_name,
                 const boost::json::value &payload) {
  try {
    notifier.emit(event_name, payload);
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg, boost::log::trivial::error)
        << "Failed to emit " << event_name << ": " << e.what();
  }
}

// One JSON object per line: {"event": ..., "payload": ..., "ts_ms": ...}.
class JsonLinesNotifier : public IOutcomeNotifier {
public:
  explicit JsonLinesNotifier(std::ostream &out);

  void emit(const std::string &event_name,
            const boost::json::value &payload) override;

private:
  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace notify
} // namespace carrierctrl
