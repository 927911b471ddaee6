#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "data/device.hpp"
#include "data/fingerprint.hpp"
#include "data/observations.hpp"
#include "inference/mac_analyzer.hpp"
#include "inference/signal.hpp"

namespace lanlens {

// TXT records of one advertised mDNS service.
struct MdnsTxtData {
  std::string service_type;
  std::map<std::string, std::string> records;
};

struct EnhancedEvidence {
  std::vector<MdnsTxtData> mdns_txt;
  std::optional<data::BannerData> banners;
  std::optional<MacAnalysis> mac_analysis;
};

struct InferenceResult {
  data::DeviceType type{data::DeviceType::unknown};
  double confidence{0.0};
};

// Substring rule over one lowercase text. Matches when any of `any_of` is a
// substring (or any of `suffix_any` is a suffix), every entry of `all_of` is
// a substring and none of `none_of` is.
struct KeywordRule {
  std::vector<std::string_view> any_of;
  std::vector<std::string_view> suffix_any;
  std::vector<std::string_view> all_of;
  std::vector<std::string_view> none_of;
  data::DeviceType type;
  double confidence;

  bool matches(const std::string &lower) const;
};

/**
 * Stateless weighted-vote classifier. Every signal adds
 * confidence * weight(source) to its suggested type; the highest total wins.
 * Ties go to the type declared first in data::DeviceType.
 */
class InferenceEngine {
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;

public:
  static double source_weight(SignalSource source);

  data::DeviceType infer(const std::vector<Signal> &signals) const;

  InferenceResult infer_enhanced(std::vector<Signal> signals,
                                 const EnhancedEvidence &evidence) const;

  std::vector<Signal> signals_from_ssdp(std::string_view server,
                                        std::string_view usn,
                                        std::string_view st) const;
  std::vector<Signal> signals_from_mdns_service_type(
      std::string_view service_type) const;
  std::vector<Signal> signals_from_port(int port) const;
  std::vector<Signal> signals_from_fingerprint(
      const data::DeviceFingerprint &fp) const;
  std::vector<Signal> signals_from_hostname(std::string_view hostname) const;
  std::vector<Signal> signals_from_mdns_txt(const MdnsTxtData &txt) const;
  std::vector<Signal> signals_from_banners(const data::BannerData &banners) const;

  data::DeviceType infer_from_all_sources(
      const std::optional<data::SsdpAnnouncement> &ssdp,
      const std::vector<std::string> &mdns_service_types,
      const std::vector<int> &open_ports,
      const std::optional<data::DeviceFingerprint> &fingerprint,
      const std::optional<std::string> &hostname) const;
};

} // namespace lanlens
