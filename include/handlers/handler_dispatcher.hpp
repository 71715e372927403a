#pragma once

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"

namespace carrierctrl {

// Lifetime: created via DI inside App::start and kept for the CLI session.
class HandlerDispatcher {
  customio::ConsoleOutput &output_;
  IHandlerFactory &handler_factory_;

public:
  HandlerDispatcher(customio::ConsoleOutput &out,
                    IHandlerFactory &handler_factory)
      : output_(out), handler_factory_(handler_factory) {}

  // False when no handler serves `subcmd`.
  bool dispatch_run(const std::string &subcmd, IHandler::Completion cont) {
    std::shared_ptr<IHandler> handler;
    try {
      handler = handler_factory_.create(subcmd);
    } catch (const std::exception &ex) {
      output_.debug() << "No handler for '" << subcmd << "': " << ex.what()
                      << std::endl;
      return false;
    }
    handler->start(std::move(cont));
    return true;
  }
};

} // namespace carrierctrl
