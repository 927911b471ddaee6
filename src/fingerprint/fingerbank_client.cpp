#include "fingerprint/fingerbank_client.hpp"

#include "lanlens_error_codes.hpp"
#include "util/mac_address.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

namespace {

std::optional<std::string> string_field(const json::object &jo,
                                        const char *key) {
  if (auto *p = jo.if_contains(key); p && p->is_string()) {
    return std::string(p->as_string());
  }
  return std::nullopt;
}

std::optional<int64_t> int_field(const json::object &jo, const char *key) {
  if (auto *p = jo.if_contains(key)) {
    if (p->is_int64()) return p->as_int64();
    if (p->is_uint64()) return static_cast<int64_t>(p->as_uint64());
    if (p->is_double()) return static_cast<int64_t>(p->as_double());
  }
  return std::nullopt;
}

std::optional<bool> bool_field(const json::object &jo, const char *key) {
  if (auto *p = jo.if_contains(key); p && p->is_bool()) {
    return p->as_bool();
  }
  return std::nullopt;
}

} // namespace

FingerbankClient::FingerbankClient(IHttpTransport &transport,
                                   ILanlensConfigProvider &config_provider)
    : transport_(transport), config_provider_(config_provider) {}

bool FingerbankClient::enabled() const {
  const auto &cfg = config_provider_.get().fingerbank;
  std::scoped_lock lock(mutex_);
  return cfg.enabled && !cfg.api_key.empty() && !disabled_;
}

void FingerbankClient::reset_rate_limit() {
  std::scoped_lock lock(mutex_);
  rate_limited_until_.reset();
}

json::object FingerbankClient::build_request_body(
    const std::string &mac, const std::optional<std::string> &dhcp_fingerprint,
    const std::optional<std::vector<std::string>> &user_agents) {
  json::object body{{"mac", macaddr::normalize_or_upper(mac)}};
  if (dhcp_fingerprint && !dhcp_fingerprint->empty()) {
    body["dhcp_fingerprint"] = *dhcp_fingerprint;
  }
  if (user_agents && !user_agents->empty()) {
    json::array agents;
    for (const auto &ua : *user_agents) agents.emplace_back(ua);
    body["user_agents"] = std::move(agents);
  }
  return body;
}

monad::MyResult<data::DeviceFingerprint>
FingerbankClient::parse_response(const std::string &body,
                                 std::chrono::system_clock::time_point now) {
  boost::system::error_code ec;
  auto jv = json::parse(body, ec);
  if (ec || !jv.is_object()) {
    return monad::MyResult<data::DeviceFingerprint>::Err(
        monad::make_error(lanlens_errors::JSON::DECODE_ERROR,
                   "Fingerbank response is not a JSON object"));
  }
  const auto &jo = jv.as_object();
  data::DeviceFingerprint fp;
  if (auto *dp = jo.if_contains("device"); dp && dp->is_object()) {
    const auto &device = dp->as_object();
    fp.fingerbank_device_name = string_field(device, "name");
    fp.fingerbank_device_id = int_field(device, "id");
    fp.is_mobile = bool_field(device, "mobile");
    fp.is_tablet = bool_field(device, "tablet");
    if (auto *pp = device.if_contains("parents"); pp && pp->is_array()) {
      std::vector<std::string> parents;
      for (const auto &parent : pp->as_array()) {
        if (!parent.is_object()) continue;
        if (auto name = string_field(parent.as_object(), "name")) {
          parents.push_back(*name);
        }
      }
      fp.fingerbank_parents = std::move(parents);
    }
  }
  fp.fingerbank_score = int_field(jo, "score");
  if (auto version = string_field(jo, "version")) {
    auto space = version->find(' ');
    if (space == std::string::npos) {
      fp.operating_system = *version;
      fp.os_version = *version;
    } else {
      fp.operating_system = version->substr(0, space);
      fp.os_version = version->substr(space + 1);
    }
  }
  fp.source = data::FingerprintSource::fingerbank;
  fp.timestamp = now;
  fp.cache_hit = false;
  return monad::MyResult<data::DeviceFingerprint>::Ok(std::move(fp));
}

monad::MyResult<data::DeviceFingerprint> FingerbankClient::interrogate(
    const std::string &mac, const std::optional<std::string> &dhcp_fingerprint,
    const std::optional<std::vector<std::string>> &user_agents) {
  using R = monad::MyResult<data::DeviceFingerprint>;
  const auto cfg = config_provider_.get().fingerbank;
  const auto now = clock_();
  {
    std::scoped_lock lock(mutex_);
    if (!cfg.enabled || disabled_) {
      return R::Err(monad::make_error(lanlens_errors::FINGERPRINT::DISABLED,
                               "Remote fingerprinting disabled"));
    }
    if (cfg.api_key.empty()) {
      return R::Err(monad::make_error(lanlens_errors::FINGERPRINT::NO_API_KEY,
                               "No Fingerbank API key configured"));
    }
    if (rate_limited_until_ && now < *rate_limited_until_) {
      return R::Err(monad::make_error(
          lanlens_errors::FINGERPRINT::RATE_LIMITED,
          "Rate limited until " +
              stringutil::formatISO8601(*rate_limited_until_)));
    }
  }

  HttpRequest req;
  req.method = "POST";
  req.url = cfg.api_url;
  req.timeout = std::chrono::seconds(cfg.timeout_seconds);
  req.headers["Authorization"] = "Bearer " + cfg.api_key;
  req.headers["Content-Type"] = "application/json";
  req.body = json::serialize(build_request_body(mac, dhcp_fingerprint, user_agents));

  BOOST_LOG_SEV(lg_, trivial::debug) << "Interrogating Fingerbank for " << mac;
  auto res = transport_.perform(req);
  if (res.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Fingerbank request failed for " << mac << ": " << res.error().what;
    return R::Err(res.error());
  }

  const int status = res.value().status;
  if (status >= 200 && status <= 299) {
    auto parsed = parse_response(res.value().body, now);
    if (parsed.is_ok()) {
      BOOST_LOG_SEV(lg_, trivial::info)
          << "Fingerbank: " << mac << " -> "
          << parsed.value().fingerbank_device_name.value_or("unknown")
          << " (score " << parsed.value().fingerbank_score.value_or(0) << ")";
    }
    return parsed;
  }

  std::scoped_lock lock(mutex_);
  if (status == 401) {
    disabled_ = true;
    if (!warned_invalid_key_) {
      warned_invalid_key_ = true;
      BOOST_LOG_SEV(lg_, trivial::warning)
          << "Fingerbank rejected the API key; remote fingerprinting disabled "
             "for this session";
    }
    return R::Err(monad::make_error(lanlens_errors::FINGERPRINT::INVALID_API_KEY,
                             "Invalid Fingerbank API key"));
  }
  if (status == 429) {
    rate_limited_until_ =
        now + std::chrono::seconds(cfg.rate_limit_backoff_seconds);
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Fingerbank rate limit hit, backing off until "
        << stringutil::formatISO8601(*rate_limited_until_);
    return R::Err(monad::make_error(lanlens_errors::FINGERPRINT::RATE_LIMITED,
                             "Fingerbank rate limit exceeded"));
  }
  BOOST_LOG_SEV(lg_, trivial::error) << "Fingerbank returned HTTP " << status;
  return R::Err(monad::make_error(lanlens_errors::FINGERPRINT::SERVER_ERROR,
                           fmt::format("Fingerbank returned HTTP {}", status)));
}

} // namespace lanlens
