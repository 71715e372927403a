#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>

#include <memory>
#include <sstream>
#include <string>

#include "carrierctrl_common.hpp"
#include "customio/console_output.hpp"
#include "device/device_backend.hpp"
#include "device/device_session.hpp"
#include "handlers/i_handler.hpp"
#include "install/installation_checker.hpp"
#include "install/installation_trigger.hpp"

namespace po = boost::program_options;

namespace carrierctrl {

struct InstallHandlerOptions {
  std::string model;
  std::string ios_version;
  bool check{false};
};

// carrierctrl install <bundle.ipcc> --model M --ios-version V [--check]
class InstallHandler : public IHandler,
                       public std::enable_shared_from_this<InstallHandler> {
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;
  device::DeviceSession &session_;
  device::IDeviceConnector &connector_;
  std::shared_ptr<install::InstallationTrigger> trigger_;
  install::InstallationChecker &checker_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;

  po::options_description opt_desc_;
  InstallHandlerOptions options_;

public:
  InstallHandler(CliCtx &cli_ctx, customio::ConsoleOutput &output,
                 device::DeviceSession &session,
                 device::IDeviceConnector &connector,
                 std::shared_ptr<install::InstallationTrigger> trigger,
                 install::InstallationChecker &checker);

  std::string command() const override { return "install"; }

  std::string print_opt_desc() const {
    std::ostringstream oss;
    oss << "Usage: \ncarrierctrl install <bundle.ipcc> --model <ProductType> "
           "--ios-version <version> [--check]\n"
        << opt_desc_ << std::endl;
    return oss.str();
  }

  void start(Completion done) override;

private:
  void verify(Completion done);
};

} // namespace carrierctrl
