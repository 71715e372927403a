#pragma once

#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "boost/di.hpp"
#include "carrierctrl_common.hpp"
#include "conf/carrierctrl_config.hpp"
#include "conf/config_sources.hpp"
#include "customio/console_output.hpp"
#include "device/device_backend.hpp"
#include "device/device_session.hpp"
#include "device/imobiledevice_backend.hpp"
#include "handlers/check_handler.hpp"
#include "handlers/conf_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/install_handler.hpp"
#include "handlers/monitor_handler.hpp"
#include "install/installation_checker.hpp"
#include "install/installation_trigger.hpp"
#include "logstream/log_stream.hpp"
#include "monitor/connection_monitor.hpp"
#include "my_error_codes.hpp"
#include "notify/outcome_notifier.hpp"
#include "util/blocker.hpp"
#include "util/io_context_manager.hpp"

namespace di = boost::di;
namespace carrierctrl {

class App : public std::enable_shared_from_this<App> {
  Blocker blocker_;
  CliCtx &cli_ctx_;
  ConfigSources &config_sources_;
  customio::ConsoleOutput *output_{nullptr};
  std::once_flag shutdown_once_flag_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  IoContextManager *io_context_manager_{nullptr};
  boost::asio::thread_pool *worker_pool_{nullptr};
  int exit_code_{EXIT_SUCCESS};

public:
  App(ConfigSources &config_sources, CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), config_sources_(config_sources) {}

  int exit_code() const { return exit_code_; }

  void print_error(const Error &err) {
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else {
      output_->error() << err << std::endl;
    }
  }

  void start() {
    static customio::ConsoleOutput output_hub(cli_ctx_.verbosity_level());
    output_ = &output_hub;

    CarrierctrlConfigProviderFile config_provider(config_sources_);
    const auto &config = config_provider.get();
    auto install_check_settings = config.install_check.to_settings();
    auto installer_settings = config.installer.to_settings();

    IoContextManager io_context_manager(config.io_threads);
    boost::asio::thread_pool worker_pool(config.worker_threads);
    io_context_manager_ = &io_context_manager;
    worker_pool_ = &worker_pool;
    notify::JsonLinesNotifier notifier(std::cout);

    auto handler_module = []() {
      return di::make_injector(
          di::bind<ConfHandler>().in(di::unique),
          di::bind<MonitorHandler>().in(di::unique),
          di::bind<InstallHandler>().in(di::unique),
          di::bind<CheckHandler>().in(di::unique),
          di::bind<IHandlerFactory>().to(
              [](const auto &inj) -> IHandlerFactory & {
                static HandlerFactoryImpl factory(
                    [&inj](const std::string &subcmd)
                        -> std::shared_ptr<IHandler> {
                      if (subcmd == "conf") {
                        return inj.template create<
                            std::shared_ptr<ConfHandler>>();
                      } else if (subcmd == "monitor") {
                        return inj.template create<
                            std::shared_ptr<MonitorHandler>>();
                      } else if (subcmd == "install") {
                        return inj.template create<
                            std::shared_ptr<InstallHandler>>();
                      } else if (subcmd == "check") {
                        return inj.template create<
                            std::shared_ptr<CheckHandler>>();
                      } else {
                        throw std::runtime_error("Unsupported subcommand: " +
                                                 subcmd);
                      }
                    });
                return factory;
              }));
    };

    auto injector = di::make_injector(
        handler_module(), di::bind<ConfigSources>().to(config_sources_),
        di::bind<ICarrierctrlConfigProvider>().to(config_provider),
        di::bind<boost::asio::io_context>().to(io_context_manager.ioc()),
        di::bind<boost::asio::thread_pool>().to(worker_pool),
        di::bind<install::InstallCheckSettings>().to(install_check_settings),
        di::bind<install::InstallerSettings>().to(installer_settings),
        di::bind<notify::IOutcomeNotifier>().to(notifier),
        di::bind<device::IPresenceSource>()
            .to<device::IMobileDevicePresenceSource>()
            .in(di::singleton),
        di::bind<device::IDeviceConnector>()
            .to<device::IMobileDeviceConnector>()
            .in(di::singleton),
        di::bind<device::ISyslogSource>()
            .to<device::IMobileDeviceSyslogSource>()
            .in(di::singleton),
        di::bind<device::IBundleInstaller>()
            .to<device::IMobileDeviceInstaller>()
            .in(di::singleton),
        di::bind<device::DeviceSession>().in(di::singleton),
        di::bind<logstream::LogStream>().in(di::singleton),
        di::bind<monitor::ConnectionMonitor>().in(di::singleton),
        di::bind<install::InstallationTrigger>().in(di::singleton),
        di::bind<install::InstallationChecker>().in(di::singleton),
        di::bind<customio::ConsoleOutput>().to(output_hub),
        di::bind<CliCtx>().to(cli_ctx_));

    auto self = this->shared_from_this();
    detail_register_shutdown(self);

    output_->debug() << "Config source directories:" << std::endl;
    for (const auto &source : config_sources_.paths_) {
      output_->debug() << " - " << source.string() << std::endl;
    }

    auto &dispatcher = injector.template create<HandlerDispatcher &>();
    bool dispatched = dispatcher.dispatch_run(
        cli_ctx_.params.subcmd, [self](std::optional<Error> err) {
          if (err) {
            self->print_error(*err);
            self->exit_code_ = EXIT_FAILURE;
          } else {
            self->output_->debug()
                << "Handler completed successfully." << std::endl;
          }
          self->blocker_.stop();
        });

    if (!dispatched) {
      output_->error() << "No valid subcommand provided. Available: "
                       << "monitor, install, check, conf." << std::endl;
      exit_code_ = EXIT_FAILURE;
      blocker_.stop();
    }

    signals_ = std::make_unique<boost::asio::signal_set>(
        io_context_manager.ioc(), SIGINT, SIGTERM);
    signals_->async_wait(
        [self](const boost::system::error_code &error, int signal) {
          if (!error) {
            const char *signal_name = (signal == SIGINT) ? "SIGINT" : "SIGTERM";
            std::cerr << signal_name << " received. Stopping..." << std::endl;
            self->blocker_.stop();
          }
        });
    blocker_.wait();
    output_->debug() << "blocker_.wait() returned, start() exiting."
                     << std::endl;
    shutdown();
  }

  void shutdown() {
    auto self = this->shared_from_this();
    std::call_once(shutdown_once_flag_, [self] {
      self->output_->debug() << "Shutting down App..." << std::endl;
      if (self->signals_) {
        boost::system::error_code ec;
        self->signals_->cancel(ec);
        self->signals_.reset();
      }
      // Let in-flight installs report before the io threads go away.
      if (self->worker_pool_) {
        self->worker_pool_->join();
        self->worker_pool_ = nullptr;
      }
      if (self->io_context_manager_) {
        self->io_context_manager_->stop();
        self->io_context_manager_ = nullptr;
      }
      self->output_->debug() << "App shutdown completed." << std::endl;
      clear_shutdown_handler();
    });
  }

  static void request_shutdown() {
    std::function<void()> handler;
    {
      std::lock_guard<std::mutex> lock(shutdown_mutex());
      handler = shutdown_handler();
    }
    if (handler) {
      handler();
    }
  }

private:
  static std::mutex &shutdown_mutex() {
    static std::mutex mutex;
    return mutex;
  }

  static std::function<void()> &shutdown_handler() {
    static std::function<void()> handler;
    return handler;
  }

  static void detail_register_shutdown(const std::shared_ptr<App> &self) {
    std::lock_guard<std::mutex> lock(shutdown_mutex());
    shutdown_handler() = [weak_self = std::weak_ptr<App>(self)] {
      if (auto shared = weak_self.lock()) {
        shared->blocker_.stop();
      }
    };
  }

  static void clear_shutdown_handler() {
    std::lock_guard<std::mutex> lock(shutdown_mutex());
    shutdown_handler() = nullptr;
  }
};

inline int launch(ConfigSources &config, CliCtx &ctx) {
  auto app = std::make_shared<App>(config, ctx);
  app->start();
  return app->exit_code();
}

} // namespace carrierctrl
