#include "notify/outcome_notifier.hpp"

#include <chrono>
#include <stdexcept>

namespace carrierctrl {
namespace notify {

namespace json = boost::json;

JsonLinesNotifier::JsonLinesNotifier(std::ostream &out) : out_(out) {}

void JsonLinesNotifier::emit(const std::string &event_name,
                             const json::value &payload) {
  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();
  json::object line{{"event", event_name},
                    {"payload", payload},
                    {"ts_ms", now_ms}};
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << json::serialize(line) << std::endl;
  if (!out_) {
    out_.clear();
    throw std::runtime_error("event stream is not writable");
  }
}

} // namespace notify
} // namespace carrierctrl
