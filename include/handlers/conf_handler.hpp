#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <optional>
#include <sstream>
#include <string>

#include "carrierctrl_common.hpp"
#include "conf/carrierctrl_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "my_error_codes.hpp"

namespace carrierctrl {

class ConfHandler : public IHandler {
  ICarrierctrlConfigProvider &config_provider_;
  customio::ConsoleOutput &output_;
  CliCtx &cli_ctx_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg;

public:
  ConfHandler(ICarrierctrlConfigProvider &config_provider, CliCtx &cli_ctx,
              customio::ConsoleOutput &output)
      : config_provider_(config_provider), output_(output), cli_ctx_(cli_ctx) {}

  // IHandler
  std::string command() const override { return "conf"; }

  std::string print_opt_desc() const {
    std::ostringstream oss;
    oss << "Usage: \ncarrierctrl conf get <key>\ncarrierctrl conf set <key> "
           "<value>\nKeys: "
        << supported_keys() << "\n"
        << std::endl;
    return oss.str();
  }

  static const char *supported_keys() {
    return "verbose, install_check.pattern, install_check.scope, "
           "install_check.case_sensitive, install_check.timeout_seconds, "
           "installer.package_type";
  }

  void start(Completion done) override;

  // Applies one key to the in-memory config and returns the JSON fragment to
  // persist. Errors: GENERAL::INVALID_ARGUMENT, GENERAL::SHOW_OPT_DESC.
  Result<json::object> apply(const std::string &key, const std::string &value);
  // nullopt for an unknown key.
  std::optional<std::string> lookup(const std::string &key) const;
};

} // namespace carrierctrl
