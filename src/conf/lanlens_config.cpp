#include "conf/lanlens_config.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include "lanlens_error_codes.hpp"

namespace lanlens {

namespace {

template <typename T>
void read_int(const json::object &jo, const char *key, T &out) {
  if (auto *p = jo.if_contains(key)) {
    out = p->to_number<T>();
  }
}

void read_string(const json::object &jo, const char *key, std::string &out) {
  if (auto *p = jo.if_contains(key)) {
    out = p->as_string().c_str();
  }
}

} // namespace

FingerbankConfig tag_invoke(const json::value_to_tag<FingerbankConfig> &,
                            const json::value &jv) {
  FingerbankConfig c{};
  if (auto *jo = jv.if_object()) {
    read_string(*jo, "api_key", c.api_key);
    read_string(*jo, "api_url", c.api_url);
    read_int(*jo, "timeout_seconds", c.timeout_seconds);
    read_int(*jo, "rate_limit_backoff_seconds", c.rate_limit_backoff_seconds);
    read_int(*jo, "cache_ttl_days", c.cache_ttl_days);
    if (auto *p = jo->if_contains("enabled")) c.enabled = p->as_bool();
  }
  return c;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const FingerbankConfig &c) {
  jv = json::object{{"api_key", c.api_key},
                    {"api_url", c.api_url},
                    {"timeout_seconds", c.timeout_seconds},
                    {"rate_limit_backoff_seconds", c.rate_limit_backoff_seconds},
                    {"cache_ttl_days", c.cache_ttl_days},
                    {"enabled", c.enabled}};
}

DiscoveryConfig tag_invoke(const json::value_to_tag<DiscoveryConfig> &,
                           const json::value &jv) {
  DiscoveryConfig c{};
  if (auto *jo = jv.if_object()) {
    read_int(*jo, "event_debounce_ms", c.event_debounce_ms);
    read_int(*jo, "scan_concurrency", c.scan_concurrency);
    read_int(*jo, "offline_after_seconds", c.offline_after_seconds);
    read_int(*jo, "upnp_timeout_seconds", c.upnp_timeout_seconds);
    read_int(*jo, "port_timeout_ms", c.port_timeout_ms);
    read_int(*jo, "ssdp_listen_seconds", c.ssdp_listen_seconds);
    read_int(*jo, "min_smart_score", c.min_smart_score);
  }
  return c;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const DiscoveryConfig &c) {
  jv = json::object{{"event_debounce_ms", c.event_debounce_ms},
                    {"scan_concurrency", c.scan_concurrency},
                    {"offline_after_seconds", c.offline_after_seconds},
                    {"upnp_timeout_seconds", c.upnp_timeout_seconds},
                    {"port_timeout_ms", c.port_timeout_ms},
                    {"ssdp_listen_seconds", c.ssdp_listen_seconds},
                    {"min_smart_score", c.min_smart_score}};
}

CacheConfig tag_invoke(const json::value_to_tag<CacheConfig> &,
                       const json::value &jv) {
  CacheConfig c{};
  if (auto *jo = jv.if_object()) {
    read_int(*jo, "arp_ttl_seconds", c.arp_ttl_seconds);
    read_int(*jo, "arp_max_entries", c.arp_max_entries);
    read_int(*jo, "upnp_ttl_hours", c.upnp_ttl_hours);
  }
  return c;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const CacheConfig &c) {
  jv = json::object{{"arp_ttl_seconds", c.arp_ttl_seconds},
                    {"arp_max_entries", c.arp_max_entries},
                    {"upnp_ttl_hours", c.upnp_ttl_hours}};
}

BehaviorConfig tag_invoke(const json::value_to_tag<BehaviorConfig> &,
                          const json::value &jv) {
  BehaviorConfig c{};
  if (auto *jo = jv.if_object()) {
    read_int(*jo, "max_history", c.max_history);
    read_int(*jo, "min_observations", c.min_observations);
    read_int(*jo, "max_profiles", c.max_profiles);
    read_int(*jo, "persist_interval", c.persist_interval);
    read_int(*jo, "retention_days", c.retention_days);
  }
  return c;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const BehaviorConfig &c) {
  jv = json::object{{"max_history", c.max_history},
                    {"min_observations", c.min_observations},
                    {"max_profiles", c.max_profiles},
                    {"persist_interval", c.persist_interval},
                    {"retention_days", c.retention_days}};
}

LanlensConfig tag_invoke(const json::value_to_tag<LanlensConfig> &,
                         const json::value &jv) {
  auto *jo = jv.if_object();
  if (!jo) {
    throw std::runtime_error("LanlensConfig is not an object");
  }
  try {
    LanlensConfig c{};
    read_string(*jo, "verbose", c.verbose);
    if (auto *p = jo->if_contains("runtime_dir"))
      c.runtime_dir = fs::path(p->as_string().c_str());
    if (auto *p = jo->if_contains("bundled_database"))
      c.bundled_database = fs::path(p->as_string().c_str());
    if (auto *p = jo->if_contains("fingerbank"))
      c.fingerbank = json::value_to<FingerbankConfig>(*p);
    if (auto *p = jo->if_contains("discovery"))
      c.discovery = json::value_to<DiscoveryConfig>(*p);
    if (auto *p = jo->if_contains("cache"))
      c.cache = json::value_to<CacheConfig>(*p);
    if (auto *p = jo->if_contains("behavior"))
      c.behavior = json::value_to<BehaviorConfig>(*p);
    return c;
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("error in parsing LanlensConfig: ") +
                             e.what());
  }
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const LanlensConfig &c) {
  json::object jo{{"verbose", c.verbose},
                  {"runtime_dir", c.runtime_dir.string()},
                  {"fingerbank", json::value_from(c.fingerbank)},
                  {"discovery", json::value_from(c.discovery)},
                  {"cache", json::value_from(c.cache)},
                  {"behavior", json::value_from(c.behavior)}};
  if (!c.bundled_database.empty()) {
    jo["bundled_database"] = c.bundled_database.string();
  }
  jv = std::move(jo);
}

LanlensConfigProviderFile::LanlensConfigProviderFile(
    ConfigSources &config_sources)
    : config_sources_(config_sources) {
  if (!config_sources.application_json) {
    std::cerr << "Failed to load App config." << std::endl;
    throw std::runtime_error("Failed to load App config.");
  }
  config_ = json::value_to<LanlensConfig>(*config_sources.application_json);
  if (config_.runtime_dir.empty() && !config_sources.paths_.empty()) {
    config_.runtime_dir = config_sources.paths_.back();
  }
}

monad::MyVoidResult LanlensConfigProviderFile::save(const json::object &content) {
  if (config_sources_.paths_.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::GENERAL::INVALID_ARGUMENT,
                                      "No configuration directory to save to"));
  }
  auto f = config_sources_.paths_.back() / "application.override.json";
  json::object merged;
  if (fs::exists(f)) {
    std::ifstream ifs(f);
    if (!ifs) {
      return monad::MyVoidResult::Err(
          monad::make_error(lanlens_errors::GENERAL::FILE_READ_WRITE,
                     "Unable to open configuration file: " + f.string()));
    }
    std::string existing((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());
    boost::system::error_code ec;
    auto jv = json::parse(existing, ec);
    if (ec || !jv.is_object()) {
      return monad::MyVoidResult::Err(monad::make_error(
          lanlens_errors::GENERAL::INVALID_ARGUMENT,
          "Configuration file is not a JSON object: " + f.string()));
    }
    merged = std::move(jv.as_object());
  }
  ConfigSources::merge_into(merged, content);

  std::ofstream ofs(f);
  if (!ofs) {
    return monad::MyVoidResult::Err(monad::make_error(
        lanlens_errors::GENERAL::FILE_READ_WRITE,
        "Unable to open configuration file for writing: " + f.string()));
  }
  ofs << json::serialize(merged);
  ofs.close();

  // Keep the in-memory view in step with what was written.
  json::value current = json::value_from(config_);
  ConfigSources::merge_into(current.as_object(), content);
  config_ = json::value_to<LanlensConfig>(current);
  return monad::MyVoidResult::Ok();
}

} // namespace lanlens
