#pragma once

#include <string>

#include "customio/console_output.hpp"
#include "discovery/device_registry.hpp"
#include "handlers/i_handler.hpp"
#include "lanlens_common.hpp"

namespace lanlens {

class DevicesHandler : public IHandler {
  DeviceRegistry &registry_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;

  monad::MyVoidResult handle_list(std::vector<data::Device> devices);
  monad::MyVoidResult handle_show(const std::string &mac);
  monad::MyVoidResult handle_label(const std::string &mac);
  monad::MyVoidResult handle_classify(const std::string &mac);

public:
  DevicesHandler(DeviceRegistry &registry, CliCtx &cli_ctx,
                 customio::ConsoleOutput &output)
      : registry_(registry), cli_ctx_(cli_ctx), output_(output) {}

  std::string command() const override { return "devices"; }
  monad::MyVoidResult start() override;

  static std::string print_opt_desc();
};

} // namespace lanlens
