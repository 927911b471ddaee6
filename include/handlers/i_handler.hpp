#pragma once

#include <functional>
#include <memory>
#include <string>

#include "result_monad.hpp"

namespace lanlens {

struct IHandlerFactory {
  virtual ~IHandlerFactory() = default;
  // Creates the handler for `subcmd`; throws std::runtime_error when the
  // subcommand is unknown.
  virtual std::shared_ptr<class IHandler> create(const std::string &subcmd) = 0;
};

// Minimal common contract for subcommand handlers
struct IHandler {
  virtual ~IHandler() = default;
  // The subcommand name this handler responds to (e.g., "scan", "conf")
  virtual std::string command() const = 0;
  virtual monad::MyVoidResult start() = 0;
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

} // namespace lanlens
