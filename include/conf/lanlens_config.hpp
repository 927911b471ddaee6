#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

#include "conf/config_sources.hpp"
#include "result_monad.hpp"

namespace lanlens {
namespace fs = std::filesystem;
namespace json = boost::json;

struct FingerbankConfig {
  std::string api_key{};
  std::string api_url{
      "https://api.fingerbank.org/api/v2/combinations/interrogate"};
  int timeout_seconds{10};
  int rate_limit_backoff_seconds{3600};
  int cache_ttl_days{30};
  bool enabled{true};

  friend FingerbankConfig tag_invoke(const json::value_to_tag<FingerbankConfig> &,
                                     const json::value &jv);
  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const FingerbankConfig &c);
};

struct DiscoveryConfig {
  int event_debounce_ms{100};
  int scan_concurrency{8};
  int offline_after_seconds{300};
  int upnp_timeout_seconds{5};
  int port_timeout_ms{2000};
  int ssdp_listen_seconds{3};
  int min_smart_score{20};

  friend DiscoveryConfig tag_invoke(const json::value_to_tag<DiscoveryConfig> &,
                                    const json::value &jv);
  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const DiscoveryConfig &c);
};

struct CacheConfig {
  int arp_ttl_seconds{30};
  int arp_max_entries{500};
  int upnp_ttl_hours{24};

  friend CacheConfig tag_invoke(const json::value_to_tag<CacheConfig> &,
                                const json::value &jv);
  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const CacheConfig &c);
};

struct BehaviorConfig {
  int max_history{100};
  int min_observations{10};
  int max_profiles{1000};
  int persist_interval{10};
  int retention_days{30};

  friend BehaviorConfig tag_invoke(const json::value_to_tag<BehaviorConfig> &,
                                   const json::value &jv);
  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const BehaviorConfig &c);
};

struct LanlensConfig {
  std::string verbose{};
  fs::path runtime_dir{};
  // Empty means <runtime_dir>/fingerprints.sqlite.
  fs::path bundled_database{};
  FingerbankConfig fingerbank{};
  DiscoveryConfig discovery{};
  CacheConfig cache{};
  BehaviorConfig behavior{};

  fs::path bundled_database_path() const {
    if (!bundled_database.empty()) return bundled_database;
    return runtime_dir / "fingerprints.sqlite";
  }

  friend LanlensConfig tag_invoke(const json::value_to_tag<LanlensConfig> &,
                                  const json::value &jv);
  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const LanlensConfig &c);
};

class ILanlensConfigProvider {
public:
  virtual ~ILanlensConfigProvider() = default;

  virtual const LanlensConfig &get() const = 0;
  virtual LanlensConfig &get() = 0;

  // Persists `content` keys into application.override.json.
  virtual monad::MyVoidResult save(const json::object &content) = 0;
};

class LanlensConfigProviderFile : public ILanlensConfigProvider {
  LanlensConfig config_;
  ConfigSources &config_sources_;

public:
  explicit LanlensConfigProviderFile(ConfigSources &config_sources);

  const LanlensConfig &get() const override { return config_; }
  LanlensConfig &get() override { return config_; }

  monad::MyVoidResult save(const json::object &content) override;
};

// Provider over an in-memory config, used by tests and one-off tools.
class LanlensConfigProviderValue : public ILanlensConfigProvider {
  LanlensConfig config_;
  json::object saved_;

public:
  explicit LanlensConfigProviderValue(LanlensConfig config)
      : config_(std::move(config)) {}

  const LanlensConfig &get() const override { return config_; }
  LanlensConfig &get() override { return config_; }

  monad::MyVoidResult save(const json::object &content) override {
    ConfigSources::merge_into(saved_, content);
    return monad::MyVoidResult::Ok();
  }

  const json::object &saved() const { return saved_; }
};

} // namespace lanlens
