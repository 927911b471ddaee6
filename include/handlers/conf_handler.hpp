#pragma once

#include <string>

#include "conf/lanlens_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "lanlens_common.hpp"

namespace lanlens {

class ConfHandler : public IHandler {
  ILanlensConfigProvider &config_provider_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;

  monad::MyVoidResult show_usage(const std::string &msg = "") {
    if (!msg.empty()) {
      output_.error() << msg << std::endl;
    }
    return monad::MyVoidResult::Err(
        monad::make_error(lanlens_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
  }

public:
  ConfHandler(ILanlensConfigProvider &config_provider, CliCtx &cli_ctx,
              customio::ConsoleOutput &output)
      : config_provider_(config_provider), cli_ctx_(cli_ctx), output_(output) {}

  std::string command() const override { return "conf"; }
  monad::MyVoidResult start() override;

  static std::string print_opt_desc() {
    return "Usage:\n"
           "  lanlens conf get <key>\n"
           "  lanlens conf set <key> <value>\n"
           "Keys: verbose, fingerbank.api_key, fingerbank.enabled, "
           "discovery.min_smart_score\n";
  }
};

} // namespace lanlens
