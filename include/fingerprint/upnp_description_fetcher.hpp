#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <optional>
#include <string>

#include "data/fingerprint.hpp"
#include "fingerprint/http_fetch.hpp"
#include "result_monad.hpp"

namespace lanlens {

class IUpnpDescriptionFetcher {
public:
  virtual ~IUpnpDescriptionFetcher() = default;

  // nullopt on any failure: bad URL, timeout, non-2xx, unparsable XML or a
  // description with no identifying field.
  virtual std::optional<data::DeviceFingerprint>
  fetch(const std::string &location_url) = 0;
};

/**
 * Parses a UPnP device description document. Fields come from the root
 * device; services are collected from the root device and every embedded
 * device. Fails with XML_PARSE_ERROR on malformed XML and NOT_FOUND when
 * none of friendlyName, manufacturer, modelName and deviceType is present.
 */
monad::MyResult<data::DeviceFingerprint>
parse_upnp_description(const std::string &xml,
                       std::chrono::system_clock::time_point now =
                           std::chrono::system_clock::now());

class HttpUpnpDescriptionFetcher : public IUpnpDescriptionFetcher {
public:
  HttpUpnpDescriptionFetcher(IHttpTransport &transport,
                             std::chrono::seconds timeout)
      : transport_(transport), timeout_(timeout) {}

  std::optional<data::DeviceFingerprint>
  fetch(const std::string &location_url) override;

private:
  IHttpTransport &transport_;
  std::chrono::seconds timeout_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
