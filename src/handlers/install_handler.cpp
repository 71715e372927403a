#include "handlers/install_handler.hpp"

#include <boost/log/sources/record_ostream.hpp>
#include <fmt/format.h>

#include <chrono>
#include <utility>

#include "my_error_codes.hpp"

namespace carrierctrl {

namespace trivial = boost::log::trivial;

InstallHandler::InstallHandler(
    CliCtx &cli_ctx, customio::ConsoleOutput &output,
    device::DeviceSession &session, device::IDeviceConnector &connector,
    std::shared_ptr<install::InstallationTrigger> trigger,
    install::InstallationChecker &checker)
    : cli_ctx_(cli_ctx), output_(output), session_(session),
      connector_(connector), trigger_(std::move(trigger)), checker_(checker),
      opt_desc_("install Options") {
  opt_desc_.add_options() //
      ("model", po::value<std::string>(&options_.model),
       "expected ProductType of the device, e.g. iPhone14,5") //
      ("ios-version", po::value<std::string>(&options_.ios_version),
       "expected iOS version of the device, e.g. 17.4.1") //
      ("check", po::bool_switch(&options_.check)->default_value(false),
       "wait for the SIM to come back after a successful install");
  po::parsed_options parsed = po::command_line_parser(cli_ctx_.unrecognized)
                                  .options(opt_desc_)
                                  .allow_unregistered()
                                  .run();
  po::store(parsed, cli_ctx_.vm);
  po::notify(cli_ctx_.vm);
}

void InstallHandler::start(Completion done) {
  auto bundle = cli_ctx_.positional_at(1);
  if (!bundle || options_.model.empty() || options_.ios_version.empty()) {
    done(make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
    return;
  }

  if (auto err = device::attach_if_absent(session_, connector_)) {
    // The trigger still runs and reports the negative outcome.
    BOOST_LOG_SEV(lg_, trivial::warning) << *err;
  }

  device::InstallationRequest request{
      *bundle, device::ExpectedIdentity{options_.model, options_.ios_version}};
  output_.info() << "Installing " << request.bundle_path.string() << " for "
                 << options_.model << " / iOS " << options_.ios_version
                 << std::endl;

  auto self = shared_from_this();
  trigger_->install(std::move(request), [self, done](bool installed) {
    self->output_.printer().outcome(
        installed, installed ? "Carrier bundle installed."
                             : "Carrier bundle was not installed.");
    if (!installed) {
      done(make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                      "Carrier bundle installation failed, see the log."));
      return;
    }
    if (self->options_.check) {
      self->verify(done);
      return;
    }
    done(std::nullopt);
  });
}

void InstallHandler::verify(Completion done) {
  output_.info() << fmt::format(
                        "Waiting up to {}s for the SIM to become ready...",
                        std::chrono::duration_cast<std::chrono::seconds>(
                            checker_.settings().timeout)
                            .count())
                 << std::endl;
  auto self = shared_from_this();
  checker_.check([self, done](bool succeeded) {
    self->output_.printer().outcome(
        succeeded, succeeded ? "SIM is ready." : "SIM did not become ready.");
    if (succeeded) {
      done(std::nullopt);
    } else {
      done(make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                      "SIM ready message not seen before the deadline."));
    }
  });
}

} // namespace carrierctrl
