#include "handlers/conf_handler.hpp"

#include <fmt/format.h>

#include <charconv>

namespace lanlens {

namespace {

constexpr const char *kSupportedKeys =
    "verbose, fingerbank.api_key, fingerbank.enabled, discovery.min_smart_score";

std::string masked(const std::string &secret) {
  if (secret.empty()) return "(unset)";
  if (secret.size() <= 4) return "****";
  return "****" + secret.substr(secret.size() - 4);
}

} // namespace

monad::MyVoidResult ConfHandler::start() {
  auto &config = config_provider_.get();

  if (cli_ctx_.positional_contains("set")) {
    auto setv_r = cli_ctx_.get_set_kv();
    if (setv_r.is_err()) {
      return show_usage(setv_r.error().what);
    }
    auto [key, value] = setv_r.value();
    monad::MyVoidResult saved = monad::MyVoidResult::Ok();
    if (key == "verbose") {
      config.verbose = value;
      saved = config_provider_.save({{"verbose", value}});
    } else if (key == "fingerbank.api_key") {
      config.fingerbank.api_key = value;
      saved = config_provider_.save(
          {{"fingerbank", json::object{{"api_key", value}}}});
      value = masked(value);
    } else if (key == "fingerbank.enabled") {
      bool bool_value = parse_bool(value);
      config.fingerbank.enabled = bool_value;
      saved = config_provider_.save(
          {{"fingerbank", json::object{{"enabled", bool_value}}}});
      value = bool_value ? "true" : "false";
    } else if (key == "discovery.min_smart_score") {
      int score = 0;
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), score);
      if (ec != std::errc() || ptr != value.data() + value.size() || score < 0 ||
          score > 100) {
        return show_usage("discovery.min_smart_score must be 0..100");
      }
      config.discovery.min_smart_score = score;
      saved = config_provider_.save(
          {{"discovery", json::object{{"min_smart_score", score}}}});
    } else {
      return show_usage(fmt::format(
          "Unknown configuration key: {}, supported keys are: {}", key,
          kSupportedKeys));
    }
    if (saved.is_err()) {
      return saved;
    }
    output_.info() << "Set " << key << " to " << value << std::endl;
    return monad::MyVoidResult::Ok();
  }

  if (cli_ctx_.positional_contains("get")) {
    auto getv_r = cli_ctx_.get_get_k();
    if (getv_r.is_err()) {
      return show_usage(getv_r.error().what);
    }
    const auto &key = getv_r.value();
    if (key == "verbose") {
      output_.out() << "verbose = " << config.verbose << std::endl;
    } else if (key == "fingerbank.api_key") {
      output_.out() << "fingerbank.api_key = "
                    << masked(config.fingerbank.api_key) << std::endl;
    } else if (key == "fingerbank.enabled") {
      output_.out() << "fingerbank.enabled = "
                    << (config.fingerbank.enabled ? "true" : "false")
                    << std::endl;
    } else if (key == "discovery.min_smart_score") {
      output_.out() << "discovery.min_smart_score = "
                    << config.discovery.min_smart_score << std::endl;
    } else {
      return show_usage(fmt::format(
          "Unknown configuration key: {}, supported keys are: {}", key,
          kSupportedKeys));
    }
    return monad::MyVoidResult::Ok();
  }

  return show_usage();
}

} // namespace lanlens
