#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lanlens {

// Built-in OUI table for the vendors seen most often on home networks. The
// bundled fingerprint database covers the long tail.
class MacVendorLookup {
public:
  std::optional<std::string> lookup(std::string_view mac) const;
  size_t size() const;
};

} // namespace lanlens
