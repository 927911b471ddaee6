#include "util/mac_vendor_lookup.hpp"

#include <algorithm>
#include <iterator>

#include "util/mac_address.hpp"

namespace lanlens {

namespace {

struct OuiVendor {
  std::string_view oui;
  std::string_view vendor;
};

// Sorted by OUI for binary search.
constexpr OuiVendor kVendors[] = {
    {"00:00:63", "HP"},
    {"00:00:F0", "Samsung"},
    {"00:01:4A", "Sony"},
    {"00:01:E6", "HP"},
    {"00:01:E7", "HP"},
    {"00:02:78", "Samsung"},
    {"00:02:A5", "HP"},
    {"00:02:B3", "Intel"},
    {"00:03:47", "Intel"},
    {"00:03:93", "Apple"},
    {"00:04:1F", "Sony"},
    {"00:04:20", "Logitech"},
    {"00:04:23", "Intel"},
    {"00:04:EA", "HP"},
    {"00:06:5B", "Dell"},
    {"00:07:AB", "Samsung"},
    {"00:07:E9", "Intel"},
    {"00:08:02", "HP"},
    {"00:08:74", "Dell"},
    {"00:08:9B", "QNAP"},
    {"00:09:18", "Samsung"},
    {"00:09:5B", "Netgear"},
    {"00:0A:27", "Apple"},
    {"00:0A:95", "Apple"},
    {"00:0A:D9", "Sony"},
    {"00:0B:0D", "Sony"},
    {"00:0B:DB", "Dell"},
    {"00:0C:6E", "Asus"},
    {"00:0C:F1", "Intel"},
    {"00:0D:4B", "Roku"},
    {"00:0D:56", "Dell"},
    {"00:0D:93", "Apple"},
    {"00:0D:AE", "Samsung"},
    {"00:0E:07", "Sony"},
    {"00:0E:0C", "Intel"},
    {"00:0E:58", "Sonos"},
    {"00:0E:A6", "Asus"},
    {"00:0F:1F", "Dell"},
    {"00:0F:B5", "Netgear"},
    {"00:0F:DE", "Sony"},
    {"00:10:F0", "Lutron"},
    {"00:10:FA", "Apple"},
    {"00:11:24", "Apple"},
    {"00:11:2F", "Asus"},
    {"00:11:32", "Synology"},
    {"00:11:43", "Dell"},
    {"00:11:55", "Synology"},
    {"00:11:D8", "Asus"},
    {"00:12:47", "Samsung"},
    {"00:13:D4", "Asus"},
    {"00:14:6C", "Netgear"},
    {"00:15:6D", "Ubiquiti"},
    {"00:15:F2", "Asus"},
    {"00:17:88", "Philips Hue"},
    {"00:18:4D", "Netgear"},
    {"00:1A:11", "Google"},
    {"00:1B:2F", "Netgear"},
    {"00:1C:62", "LG"},
    {"00:1E:2A", "Netgear"},
    {"00:1E:75", "LG"},
    {"00:1F:6B", "LG"},
    {"00:1F:E2", "LG"},
    {"00:22:A9", "LG"},
    {"00:24:83", "LG"},
    {"00:24:88", "Philips"},
    {"00:27:0E", "TP-Link"},
    {"00:27:22", "Ubiquiti"},
    {"00:31:92", "TP-Link"},
    {"00:55:DA", "Nanoleaf"},
    {"00:9E:C8", "Xiaomi"},
    {"00:D0:2D", "Honeywell"},
    {"00:FC:8B", "Amazon"},
    {"01:00:5E", "IPv4 Multicast"},
    {"04:18:D6", "Ubiquiti"},
    {"04:CF:8C", "Xiaomi"},
    {"08:05:81", "Roku"},
    {"08:86:3B", "Belkin"},
    {"0C:1D:AF", "Xiaomi"},
    {"0C:47:C9", "Amazon"},
    {"10:2A:B3", "Xiaomi"},
    {"10:CE:A9", "Amazon"},
    {"10:D5:61", "Tuya"},
    {"10:FE:ED", "TP-Link"},
    {"14:91:82", "Belkin"},
    {"14:CC:20", "TP-Link"},
    {"14:CF:92", "TP-Link"},
    {"14:F6:5A", "Xiaomi"},
    {"18:59:36", "Xiaomi"},
    {"18:74:2E", "Amazon"},
    {"18:A6:F7", "TP-Link"},
    {"18:B4:30", "Google Nest"},
    {"18:E8:29", "Ubiquiti"},
    {"18:FE:34", "Espressif"},
    {"1C:F2:9A", "Google"},
    {"20:EF:BD", "Roku"},
    {"24:0A:C4", "Espressif"},
    {"24:5A:4C", "Ubiquiti"},
    {"24:5E:BE", "QNAP"},
    {"24:6F:28", "Espressif"},
    {"24:A4:3C", "Ubiquiti"},
    {"24:B2:DE", "Espressif"},
    {"24:F5:A2", "Belkin"},
    {"28:93:FE", "Honeywell"},
    {"2C:3A:E8", "Espressif"},
    {"2C:AA:8E", "Wyze"},
    {"30:AE:A4", "Espressif"},
    {"30:B4:B8", "Ecobee"},
    {"33:33:00", "IPv6 Multicast"},
    {"34:3E:A4", "Ring"},
    {"34:7E:5C", "Sonos"},
    {"34:D2:70", "Amazon"},
    {"3C:37:86", "Arlo"},
    {"3C:5A:B4", "Google"},
    {"40:38:C9", "Ring"},
    {"40:B4:CD", "Amazon"},
    {"44:61:32", "Ecobee"},
    {"48:A6:B8", "Sonos"},
    {"48:F3:17", "Schlage"},
    {"54:60:09", "Google"},
    {"54:81:AD", "Logitech"},
    {"58:EF:68", "Belkin"},
    {"5C:31:3E", "Honeywell"},
    {"5C:AA:FD", "Sonos"},
    {"64:16:66", "Google Nest"},
    {"68:57:2D", "Tuya"},
    {"6C:8B:D3", "Ring"},
    {"74:DA:38", "Logitech"},
    {"78:28:CA", "Sonos"},
    {"78:8C:B5", "Wyze"},
    {"78:FF:57", "Lutron"},
    {"7C:49:EB", "Yeelight"},
    {"90:A2:DA", "Ring"},
    {"94:10:3E", "Belkin"},
    {"94:9F:3E", "Sonos"},
    {"94:EB:2C", "Google"},
    {"A0:B4:39", "Arlo"},
    {"A4:5D:36", "Logitech"},
    {"A4:77:33", "Google"},
    {"AC:3A:7A", "Roku"},
    {"AC:89:95", "Philips"},
    {"B0:A7:37", "Roku"},
    {"B4:75:0E", "Belkin"},
    {"B8:01:1F", "Nanoleaf"},
    {"B8:1F:5D", "SimpliSafe"},
    {"B8:27:EB", "Raspberry Pi"},
    {"B8:3E:59", "Roku"},
    {"BC:5C:4C", "August"},
    {"C4:72:95", "Logitech"},
    {"CC:F9:57", "Honeywell"},
    {"D0:3F:27", "Wyze"},
    {"D0:52:A8", "Arlo"},
    {"D0:73:D5", "LIFX"},
    {"D8:1F:12", "Tuya"},
    {"D8:3A:DD", "Raspberry Pi"},
    {"DC:A6:32", "Raspberry Pi"},
    {"E4:5F:01", "Raspberry Pi"},
    {"EC:1A:59", "Belkin Wemo"},
    {"EC:B5:FA", "Philips Hue"},
    {"F8:0F:F9", "Google Nest"},
    {"FC:9C:A7", "TP-Link Kasa"},
};

} // namespace

std::optional<std::string> MacVendorLookup::lookup(std::string_view mac) const {
  auto prefix = macaddr::oui_prefix(mac);
  if (prefix.empty()) {
    return std::nullopt;
  }
  auto it = std::lower_bound(
      std::begin(kVendors), std::end(kVendors), prefix,
      [](const OuiVendor &e, const std::string &key) { return e.oui < key; });
  if (it != std::end(kVendors) && it->oui == prefix) {
    return std::string(it->vendor);
  }
  return std::nullopt;
}

size_t MacVendorLookup::size() const { return std::size(kVendors); }

} // namespace lanlens
