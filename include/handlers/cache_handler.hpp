#pragma once

#include <string>

#include "behavior/behavior_tracker.hpp"
#include "cache/arp_cache.hpp"
#include "cache/fingerprint_cache.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "lanlens_common.hpp"
#include "state/bundled_database.hpp"

namespace lanlens {

// lanlens cache [stats|clear|prune|invalidate <mac>]
class CacheHandler : public IHandler {
  ArpCache &arp_cache_;
  FingerprintCache &fingerprint_cache_;
  BehaviorTracker &behavior_;
  IBundledDatabase &bundled_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;

  monad::MyVoidResult show_stats();

public:
  CacheHandler(ArpCache &arp_cache, FingerprintCache &fingerprint_cache,
               BehaviorTracker &behavior, IBundledDatabase &bundled,
               CliCtx &cli_ctx, customio::ConsoleOutput &output)
      : arp_cache_(arp_cache), fingerprint_cache_(fingerprint_cache),
        behavior_(behavior), bundled_(bundled), cli_ctx_(cli_ctx),
        output_(output) {}

  std::string command() const override { return "cache"; }
  monad::MyVoidResult start() override;

  static std::string print_opt_desc();
};

} // namespace lanlens
