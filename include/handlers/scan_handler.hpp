#pragma once

#include <string>

#include "customio/console_output.hpp"
#include "discovery/device_registry.hpp"
#include "handlers/i_handler.hpp"
#include "lanlens_common.hpp"

namespace lanlens {

// lanlens scan [quick|full|arp] [--format json]
class ScanHandler : public IHandler {
  DeviceRegistry &registry_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;

public:
  ScanHandler(DeviceRegistry &registry, CliCtx &cli_ctx,
              customio::ConsoleOutput &output)
      : registry_(registry), cli_ctx_(cli_ctx), output_(output) {}

  std::string command() const override { return "scan"; }
  monad::MyVoidResult start() override;

  static std::string print_opt_desc();
};

} // namespace lanlens
