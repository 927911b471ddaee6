#include "conf/config_sources.hpp"

#include <fstream>
#include <iterator>

#include "lanlens_error_codes.hpp"

namespace lanlens {

namespace {

monad::MyResult<std::optional<json::object>> read_json_object(const fs::path &file) {
  std::error_code fec;
  if (!fs::exists(file, fec)) {
    return monad::MyResult<std::optional<json::object>>::Ok(std::nullopt);
  }
  std::ifstream ifs(file);
  if (!ifs) {
    return monad::MyResult<std::optional<json::object>>::Err(
        monad::make_error(lanlens_errors::GENERAL::FILE_READ_WRITE,
                   "Unable to open configuration file: " + file.string()));
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code ec;
  auto jv = json::parse(content, ec);
  if (ec) {
    return monad::MyResult<std::optional<json::object>>::Err(monad::make_error(
        lanlens_errors::JSON::MALFORMED,
        "Failed to parse " + file.string() + ": " + ec.message()));
  }
  if (!jv.is_object()) {
    return monad::MyResult<std::optional<json::object>>::Err(monad::make_error(
        lanlens_errors::GENERAL::INVALID_ARGUMENT,
        "Configuration file is not a JSON object: " + file.string()));
  }
  return monad::MyResult<std::optional<json::object>>::Ok(std::move(jv.as_object()));
}

} // namespace

ConfigSources::ConfigSources(std::vector<fs::path> paths,
                             std::vector<std::string> profiles,
                             std::map<std::string, std::string> cli_overrides)
    : paths_(std::move(paths)), profiles_(std::move(profiles)),
      cli_overrides_(std::move(cli_overrides)) {
  if (auto r = json_content("application"); r.is_ok()) {
    application_json = std::move(r.value());
  }
  if (auto r = json_content("log_config"); r.is_ok()) {
    logging_json = std::move(r.value());
  }
}

void ConfigSources::merge_into(json::object &base, const json::object &overlay) {
  for (const auto &[key, value] : overlay) {
    auto *existing = base.if_contains(key);
    if (existing && existing->is_object() && value.is_object()) {
      merge_into(existing->as_object(), value.as_object());
    } else {
      base[key] = value;
    }
  }
}

monad::MyResult<json::value> ConfigSources::json_content(const std::string &name) const {
  json::object merged;
  bool found = false;
  std::vector<std::string> file_names{name + ".json"};
  for (const auto &profile : profiles_) {
    file_names.push_back(name + "." + profile + ".json");
  }
  file_names.push_back(name + ".override.json");

  for (const auto &dir : paths_) {
    for (const auto &file_name : file_names) {
      auto r = read_json_object(dir / file_name);
      if (r.is_err()) {
        return monad::MyResult<json::value>::Err(r.error());
      }
      if (r.value()) {
        merge_into(merged, *r.value());
        found = true;
      }
    }
  }
  if (!found) {
    return monad::MyResult<json::value>::Err(monad::make_error(
        lanlens_errors::GENERAL::FILE_NOT_FOUND,
        "No configuration file named " + name + ".json in any config dir"));
  }
  if (name == "application") {
    for (const auto &[key, value] : cli_overrides_) {
      merged[key] = value;
    }
  }
  return monad::MyResult<json::value>::Ok(json::value(std::move(merged)));
}

} // namespace lanlens
