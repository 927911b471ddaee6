#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "result_monad.hpp"

namespace lanlens {
namespace fs = std::filesystem;
namespace json = boost::json;

/**
 * Layered JSON configuration. For a name such as "application" every config
 * directory contributes, in order:
 *   <name>.json, <name>.<profile>.json (per profile), <name>.override.json
 * Later files override earlier ones key by key (objects merge recursively).
 * Values given on the command line override everything at the top level.
 */
class ConfigSources {
public:
  ConfigSources(std::vector<fs::path> paths, std::vector<std::string> profiles,
                std::map<std::string, std::string> cli_overrides = {});

  monad::MyResult<json::value> json_content(const std::string &name) const;

  // Every path beyond the first is writable by the user; the last one gets
  // application.override.json.
  std::vector<fs::path> paths_;
  std::vector<std::string> profiles_;
  std::map<std::string, std::string> cli_overrides_;

  std::optional<json::value> application_json;
  std::optional<json::value> logging_json;

  // Recursively copies every key of `overlay` into `base`.
  static void merge_into(json::object &base, const json::object &overlay);
};

} // namespace lanlens
