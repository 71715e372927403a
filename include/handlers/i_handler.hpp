#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "util/result.hpp"

namespace carrierctrl {

// IHandlerFactory
struct IHandlerFactory {
  virtual ~IHandlerFactory() = default;
  // Create a new instance of the handler
  virtual std::shared_ptr<class IHandler> create(const std::string &subcmd) = 0;
};

// Minimal common contract for subcommand handlers
struct IHandler {
  // Called once when the handler is done, with the error if it failed.
  using Completion = std::function<void(std::optional<Error>)>;

  virtual ~IHandler() = default;
  // The subcommand name this handler responds to (e.g., "install")
  virtual std::string command() const = 0;
  // Kick off the work. Long running handlers never call `done` and run until
  // the app is interrupted.
  virtual void start(Completion done) = 0;
};

struct HandlerFactoryImpl : public IHandlerFactory {
  using CreatorFunc =
      std::function<std::shared_ptr<IHandler>(const std::string &subcmd)>;
  CreatorFunc creator_;

  explicit HandlerFactoryImpl(CreatorFunc creator)
      : creator_(std::move(creator)) {}

  std::shared_ptr<IHandler> create(const std::string &subcmd) override {
    return creator_(subcmd);
  }
};

} // namespace carrierctrl
