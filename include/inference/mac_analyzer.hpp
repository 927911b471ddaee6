#pragma once

#include <optional>
#include <string>
#include <vector>

#include "data/device.hpp"
#include "inference/signal.hpp"

namespace lanlens {

enum class OuiAgeEstimate { legacy, established, modern, recent, unknown };
enum class VendorConfidence { high, medium, low, randomized, unknown };

std::string to_string(OuiAgeEstimate a);
std::string to_string(VendorConfidence c);

struct MacAnalysis {
  std::string oui; // "AA:BB:CC"
  std::optional<std::string> vendor;
  bool is_locally_administered{false};
  bool is_randomized{false};
  bool is_virtual_machine{false};
  OuiAgeEstimate age_estimate{OuiAgeEstimate::unknown};
  VendorConfidence vendor_confidence{VendorConfidence::unknown};
  std::vector<data::DeviceType> vendor_categories;
  std::optional<data::DeviceType> vendor_specialization;
};

// Reads what a MAC address and its vendor string reveal about a device.
class MacAnalyzer {
public:
  MacAnalysis analyze(const std::string &mac,
                      const std::optional<std::string> &vendor) const;

  static std::vector<Signal> generate_signals(const MacAnalysis &analysis);
};

} // namespace lanlens
