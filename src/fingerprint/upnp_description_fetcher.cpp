#include "fingerprint/upnp_description_fetcher.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <sstream>
#include <vector>

#include "lanlens_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

namespace pt = boost::property_tree;

namespace {

std::optional<std::string> child_text(const pt::ptree &node, const char *name) {
  auto v = node.get_optional<std::string>(name);
  if (!v) return std::nullopt;
  auto t = stringutil::trimmed(*v);
  if (t.empty()) return std::nullopt;
  return t;
}

void collect_services(const pt::ptree &device,
                      std::vector<data::UpnpService> &out) {
  if (auto list = device.get_child_optional("serviceList")) {
    for (const auto &[name, svc] : *list) {
      if (name != "service") continue;
      auto type = child_text(svc, "serviceType");
      auto id = child_text(svc, "serviceId");
      if (!type || !id) continue;
      out.push_back(data::UpnpService{*type, *id, child_text(svc, "controlURL"),
                                      child_text(svc, "eventSubURL"),
                                      child_text(svc, "SCPDURL")});
    }
  }
  if (auto list = device.get_child_optional("deviceList")) {
    for (const auto &[name, embedded] : *list) {
      if (name == "device") collect_services(embedded, out);
    }
  }
}

} // namespace

monad::MyResult<data::DeviceFingerprint>
parse_upnp_description(const std::string &xml,
                       std::chrono::system_clock::time_point now) {
  pt::ptree tree;
  try {
    std::istringstream iss(xml);
    pt::read_xml(iss, tree, pt::xml_parser::no_comments);
  } catch (const pt::xml_parser_error &e) {
    return monad::MyResult<data::DeviceFingerprint>::Err(monad::make_error(
        lanlens_errors::FINGERPRINT::XML_PARSE_ERROR,
        std::string("Invalid UPnP description: ") + e.what()));
  }

  auto device = tree.get_child_optional("root.device");
  if (!device) {
    return monad::MyResult<data::DeviceFingerprint>::Err(
        monad::make_error(lanlens_errors::FINGERPRINT::NOT_FOUND,
                   "UPnP description has no root device"));
  }

  data::DeviceFingerprint fp;
  fp.friendly_name = child_text(*device, "friendlyName");
  fp.manufacturer = child_text(*device, "manufacturer");
  fp.manufacturer_url = child_text(*device, "manufacturerURL");
  fp.model_description = child_text(*device, "modelDescription");
  fp.model_name = child_text(*device, "modelName");
  fp.model_number = child_text(*device, "modelNumber");
  fp.serial_number = child_text(*device, "serialNumber");
  fp.upnp_device_type = child_text(*device, "deviceType");

  if (!fp.friendly_name && !fp.manufacturer && !fp.model_name &&
      !fp.upnp_device_type) {
    return monad::MyResult<data::DeviceFingerprint>::Err(
        monad::make_error(lanlens_errors::FINGERPRINT::NOT_FOUND,
                   "UPnP description carries no identifying fields"));
  }

  std::vector<data::UpnpService> services;
  collect_services(*device, services);
  if (!services.empty()) {
    fp.upnp_services = std::move(services);
  }
  fp.source = data::FingerprintSource::upnp;
  fp.timestamp = now;
  fp.cache_hit = false;
  return monad::MyResult<data::DeviceFingerprint>::Ok(std::move(fp));
}

std::optional<data::DeviceFingerprint>
HttpUpnpDescriptionFetcher::fetch(const std::string &location_url) {
  HttpRequest req;
  req.url = location_url;
  req.timeout = timeout_;
  auto res = transport_.perform(req);
  if (res.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "UPnP description fetch failed for " << location_url << ": "
        << res.error().what;
    return std::nullopt;
  }
  const auto &response = res.value();
  if (response.status < 200 || response.status > 299) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "UPnP description " << location_url << " returned HTTP "
        << response.status;
    return std::nullopt;
  }
  auto parsed = parse_upnp_description(response.body);
  if (parsed.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "UPnP description " << location_url << ": " << parsed.error().what;
    return std::nullopt;
  }
  return std::move(parsed.value());
}

} // namespace lanlens
