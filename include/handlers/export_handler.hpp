#pragma once

#include <string>

#include "customio/console_output.hpp"
#include "discovery/device_registry.hpp"
#include "export/device_exporter.hpp"
#include "handlers/i_handler.hpp"
#include "lanlens_common.hpp"

namespace lanlens {

// lanlens export [json|csv] [--output DIR]
class ExportHandler : public IHandler {
  DeviceRegistry &registry_;
  DeviceExporter &exporter_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;

public:
  ExportHandler(DeviceRegistry &registry, DeviceExporter &exporter,
                CliCtx &cli_ctx, customio::ConsoleOutput &output)
      : registry_(registry), exporter_(exporter), cli_ctx_(cli_ctx),
        output_(output) {}

  std::string command() const override { return "export"; }
  monad::MyVoidResult start() override;
};

} // namespace lanlens
