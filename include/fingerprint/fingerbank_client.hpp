#pragma once

#include <boost/json.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conf/lanlens_config.hpp"
#include "data/fingerprint.hpp"
#include "fingerprint/http_fetch.hpp"
#include "result_monad.hpp"
#include "util/clock.hpp"

namespace lanlens {

class IFingerbankClient {
public:
  virtual ~IFingerbankClient() = default;

  virtual monad::MyResult<data::DeviceFingerprint>
  interrogate(const std::string &mac,
              const std::optional<std::string> &dhcp_fingerprint,
              const std::optional<std::vector<std::string>> &user_agents) = 0;

  // A key is configured and the service has not been disabled this session.
  virtual bool enabled() const = 0;
};

/**
 * Client for the Fingerbank v2 interrogate endpoint.
 *
 * A 401 disables remote lookups for the rest of the process and logs one
 * warning. A 429 blocks further calls for the configured back-off window.
 */
class FingerbankClient : public IFingerbankClient {
public:
  FingerbankClient(IHttpTransport &transport,
                   ILanlensConfigProvider &config_provider);

  void set_clock(WallClock clock) { clock_ = std::move(clock); }

  monad::MyResult<data::DeviceFingerprint> interrogate(
      const std::string &mac, const std::optional<std::string> &dhcp_fingerprint,
      const std::optional<std::vector<std::string>> &user_agents) override;

  bool enabled() const override;

  void reset_rate_limit();

  static boost::json::object
  build_request_body(const std::string &mac,
                     const std::optional<std::string> &dhcp_fingerprint,
                     const std::optional<std::vector<std::string>> &user_agents);

  static monad::MyResult<data::DeviceFingerprint>
  parse_response(const std::string &body,
                 std::chrono::system_clock::time_point now);

private:
  IHttpTransport &transport_;
  ILanlensConfigProvider &config_provider_;
  WallClock clock_{system_wall_clock()};

  mutable std::mutex mutex_;
  bool disabled_{false};
  bool warned_invalid_key_{false};
  std::optional<std::chrono::system_clock::time_point> rate_limited_until_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
