#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lanlens {
namespace macaddr {

// "a:b:c:1:22:3" / "aa-bb-cc-11-22-33" / "aabbcc112233" -> "AA:BB:CC:11:22:33".
// Returns nullopt when the input does not hold six octets.
std::optional<std::string> normalize(std::string_view mac);

// Like normalize() but falls back to an uppercased copy of the input.
std::string normalize_or_upper(std::string_view mac);

// First three octets, uppercase, no separators ("AABBCC").
std::string oui(std::string_view mac);

// Colon separated OUI ("AA:BB:CC").
std::string oui_prefix(std::string_view mac);

std::optional<unsigned> first_octet(std::string_view mac);

inline bool is_locally_administered(unsigned first) { return (first & 0x02) != 0; }
inline bool is_multicast(unsigned first) { return (first & 0x01) != 0; }

bool is_broadcast_or_zero(std::string_view mac);

}  // namespace macaddr
}  // namespace lanlens
