#include "util/mac_address.hpp"

#include <cctype>
#include <vector>

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace lanlens {
namespace macaddr {

namespace {

bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

std::optional<std::vector<unsigned>> octets(std::string_view mac) {
  std::vector<unsigned> out;
  auto trimmed = stringutil::trimmed(std::string(mac));
  bool has_separator =
      trimmed.find_first_of(":-.") != std::string::npos;
  if (!has_separator) {
    if (trimmed.size() != 12) return std::nullopt;
    for (size_t i = 0; i < 12; i += 2) {
      if (!is_hex(trimmed[i]) || !is_hex(trimmed[i + 1])) return std::nullopt;
      out.push_back(std::stoul(trimmed.substr(i, 2), nullptr, 16));
    }
    return out;
  }
  std::string part;
  auto flush = [&]() -> bool {
    if (part.empty() || part.size() > 2) return false;
    for (char c : part) {
      if (!is_hex(c)) return false;
    }
    out.push_back(std::stoul(part, nullptr, 16));
    part.clear();
    return true;
  };
  for (char c : trimmed) {
    if (c == ':' || c == '-') {
      if (!flush()) return std::nullopt;
    } else {
      part.push_back(c);
    }
  }
  if (!flush() || out.size() != 6) return std::nullopt;
  return out;
}

}  // namespace

std::optional<std::string> normalize(std::string_view mac) {
  auto o = octets(mac);
  if (!o) return std::nullopt;
  return fmt::format("{:02X}:{:02X}:{:02X}:{:02X}:{:02X}:{:02X}", (*o)[0],
                     (*o)[1], (*o)[2], (*o)[3], (*o)[4], (*o)[5]);
}

std::string normalize_or_upper(std::string_view mac) {
  if (auto n = normalize(mac)) return *n;
  return stringutil::toUpperCase(stringutil::trimmed(std::string(mac)));
}

std::string oui(std::string_view mac) {
  auto o = octets(mac);
  if (!o) return {};
  return fmt::format("{:02X}{:02X}{:02X}", (*o)[0], (*o)[1], (*o)[2]);
}

std::string oui_prefix(std::string_view mac) {
  auto o = octets(mac);
  if (!o) return {};
  return fmt::format("{:02X}:{:02X}:{:02X}", (*o)[0], (*o)[1], (*o)[2]);
}

std::optional<unsigned> first_octet(std::string_view mac) {
  auto o = octets(mac);
  if (!o) return std::nullopt;
  return (*o)[0];
}

bool is_broadcast_or_zero(std::string_view mac) {
  auto n = normalize(mac);
  return !n || *n == "FF:FF:FF:FF:FF:FF" || *n == "00:00:00:00:00:00";
}

}  // namespace macaddr
}  // namespace lanlens
