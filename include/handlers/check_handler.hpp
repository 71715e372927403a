#pragma once

#include <boost/program_options.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include "carrierctrl_common.hpp"
#include "customio/console_output.hpp"
#include "device/device_backend.hpp"
#include "device/device_session.hpp"
#include "handlers/i_handler.hpp"
#include "install/installation_checker.hpp"

namespace po = boost::program_options;

namespace carrierctrl {

// carrierctrl check [--timeout SECONDS]
class CheckHandler : public IHandler,
                     public std::enable_shared_from_this<CheckHandler> {
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;
  device::DeviceSession &session_;
  device::IDeviceConnector &connector_;
  install::InstallationChecker &checker_;

  po::options_description opt_desc_;
  std::int64_t timeout_seconds_{0};

public:
  CheckHandler(CliCtx &cli_ctx, customio::ConsoleOutput &output,
               device::DeviceSession &session,
               device::IDeviceConnector &connector,
               install::InstallationChecker &checker);

  std::string command() const override { return "check"; }

  void start(Completion done) override;
};

} // namespace carrierctrl
