#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common_macros.hpp"
#include "lanlens_error_codes.hpp"
#include "result_monad.hpp"

namespace lanlens {
namespace fs = std::filesystem;
namespace po = boost::program_options;

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::vector<std::string> profiles;
  fs::path runtime_dir;
  std::string subcmd;
  std::string verbose; // trace|debug|info|warning|error or vvvv
  bool silent = false;
  size_t offset = 0;
  size_t limit = 50;
  std::string format;  // json|csv|table, per subcommand default
  std::string output;  // export directory
  bool force = false;  // bypass caches
  std::optional<int> min_score;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  std::vector<std::string> unrecognized;
  CliParams params;

  CliCtx(po::variables_map &&vm,                  //
         std::vector<std::string> &&positionals,  //
         std::vector<std::string> &&unrecognized, //
         CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}
  ~CliCtx() { DEBUG_PRINT("CliCtx destroyed"); }

  // True iff the option was given explicitly rather than defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }
  // positionals[0] is the subcommand; index 1 is its first argument.
  std::optional<std::string> positional_at(size_t index) const {
    if (index < positionals.size()) return positionals[index];
    return std::nullopt;
  }
  size_t positional_count() const { return positionals.size(); }

  std::pair<size_t, size_t> offset_limit() const {
    return std::make_pair(params.offset, params.limit);
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }

  // lanlens conf set <key> <value>
  monad::MyResult<std::pair<std::string, std::string>> get_set_kv() const {
    auto it = std::find(positionals.begin(), positionals.end(), "set");
    size_t set_pos = static_cast<size_t>(it - positionals.begin());
    if (it == positionals.end() || set_pos + 2 >= positionals.size()) {
      return monad::MyResult<std::pair<std::string, std::string>>::Err(monad::make_error(
          lanlens_errors::GENERAL::SHOW_OPT_DESC,
          "Both key and value must be provided for set operation."));
    }
    return monad::MyResult<std::pair<std::string, std::string>>::Ok(
        {positionals[set_pos + 1], positionals[set_pos + 2]});
  }

  // lanlens conf get <key>
  monad::MyResult<std::string> get_get_k() const {
    auto it = std::find(positionals.begin(), positionals.end(), "get");
    size_t get_pos = static_cast<size_t>(it - positionals.begin());
    if (it == positionals.end() || get_pos + 1 >= positionals.size()) {
      return monad::MyResult<std::string>::Err(
          monad::make_error(lanlens_errors::GENERAL::SHOW_OPT_DESC,
                     "Key must be provided for get operation."));
    }
    return monad::MyResult<std::string>::Ok(positionals[get_pos + 1]);
  }
};

inline bool parse_bool(const std::string &value) {
  std::string val_lower = value;
  std::transform(val_lower.begin(), val_lower.end(), val_lower.begin(),
                 ::tolower);
  return (val_lower == "1" || val_lower == "true" || val_lower == "yes" ||
          val_lower == "on");
}

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 6> kKnown{
      "scan", "listen", "devices", "export", "cache", "conf"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

// Moves the first known subcommand to the front of `positionals` and stores
// it in `subcmd`. Leaves both untouched when none is present.
inline void normalize_cli_subcommand(std::string &subcmd,
                                     std::vector<std::string> &positionals) {
  auto it = std::find_if(positionals.begin(), positionals.end(),
                         [](const std::string &p) { return is_known_subcommand(p); });
  if (it == positionals.end()) {
    return;
  }
  subcmd = *it;
  if (it != positionals.begin()) {
    std::rotate(positionals.begin(), it, it + 1);
  }
}

} // namespace lanlens
