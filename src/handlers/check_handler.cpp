#include "handlers/check_handler.hpp"

#include <chrono>
#include <optional>

#include "my_error_codes.hpp"

namespace carrierctrl {

CheckHandler::CheckHandler(CliCtx &cli_ctx, customio::ConsoleOutput &output,
                           device::DeviceSession &session,
                           device::IDeviceConnector &connector,
                           install::InstallationChecker &checker)
    : cli_ctx_(cli_ctx), output_(output), session_(session),
      connector_(connector), checker_(checker), opt_desc_("check Options") {
  opt_desc_.add_options() //
      ("timeout", po::value<std::int64_t>(&timeout_seconds_),
       "seconds to wait for the SIM ready message, overrides "
       "install_check.timeout_seconds");
  po::parsed_options parsed = po::command_line_parser(cli_ctx_.unrecognized)
                                  .options(opt_desc_)
                                  .allow_unregistered()
                                  .run();
  po::store(parsed, cli_ctx_.vm);
  po::notify(cli_ctx_.vm);
}

void CheckHandler::start(Completion done) {
  if (timeout_seconds_ < 0) {
    done(make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                    "--timeout must not be negative."));
    return;
  }
  if (auto err = device::attach_if_absent(session_, connector_)) {
    output_.warning() << err->what << std::endl;
  }

  std::optional<std::chrono::milliseconds> timeout;
  if (timeout_seconds_ > 0) {
    timeout = std::chrono::seconds(timeout_seconds_);
  }
  auto self = shared_from_this();
  checker_.check(
      [self, done](bool succeeded) {
        self->output_.printer().outcome(succeeded,
                                        succeeded ? "SIM is ready."
                                                  : "SIM did not become ready.");
        if (succeeded) {
          done(std::nullopt);
        } else {
          done(make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                          "SIM ready message not seen before the deadline."));
        }
      },
      timeout);
}

} // namespace carrierctrl
