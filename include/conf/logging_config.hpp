#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace carrierctrl {

namespace json = boost::json;

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{"logs"};
  std::string log_file{"carrierctrl.log"};
  std::uint64_t rotation_size{10 * 1024 * 1024};
  bool console{true};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv) {
    const auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    try {
      LoggingConfig lc{};
      if (auto *p = jo_p->if_contains("level"))
        lc.level = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("log_dir"))
        lc.log_dir = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("log_file"))
        lc.log_file = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("rotation_size"))
        lc.rotation_size = p->to_number<std::uint64_t>();
      if (auto *p = jo_p->if_contains("console"))
        lc.console = p->as_bool();
      return lc;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("error in parsing LoggingConfig: ") +
                               e.what());
    }
  }
};

} // namespace carrierctrl
