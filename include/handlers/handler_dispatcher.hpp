#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "lanlens_common.hpp"

namespace lanlens {

// Created by the injector for the duration of one CLI invocation.
class HandlerDispatcher {
  customio::ConsoleOutput &output_;
  CliCtx &cli_ctx_;
  IHandlerFactory &handler_factory_;

public:
  HandlerDispatcher(customio::ConsoleOutput &out, //
                    CliCtx &ctx,                  //
                    IHandlerFactory &handler_factory)
      : output_(out), cli_ctx_(ctx), handler_factory_(handler_factory) {}

  // False when no handler exists for `subcmd`; otherwise runs it and hands
  // the outcome to `cont`.
  bool dispatch_run(const std::string &subcmd,
                    const std::function<void(monad::MyVoidResult &&)> &cont) {
    std::shared_ptr<IHandler> handler;
    try {
      handler = handler_factory_.create(subcmd);
    } catch (const std::runtime_error &ex) {
      output_.debug() << ex.what() << std::endl;
      return false;
    }
    output_.debug() << "Dispatching " << handler->command() << " with "
                    << cli_ctx_.positional_count() << " positionals"
                    << std::endl;
    cont(handler->start());
    return true;
  }
};

} // namespace lanlens
