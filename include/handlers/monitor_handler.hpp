#pragma once

#include <memory>
#include <string>

#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "monitor/connection_monitor.hpp"

namespace carrierctrl {

// carrierctrl monitor: publishes device events until interrupted.
class MonitorHandler : public IHandler {
  customio::ConsoleOutput &output_;
  std::shared_ptr<monitor::ConnectionMonitor> monitor_;

public:
  MonitorHandler(customio::ConsoleOutput &output,
                 std::shared_ptr<monitor::ConnectionMonitor> monitor)
      : output_(output), monitor_(std::move(monitor)) {}

  std::string command() const override { return "monitor"; }

  void start(Completion done) override {
    if (auto err = monitor_->subscribe()) {
      done(std::move(err));
      return;
    }
    output_.info() << "Watching for devices, press Ctrl-C to stop."
                   << std::endl;
  }
};

} // namespace carrierctrl
