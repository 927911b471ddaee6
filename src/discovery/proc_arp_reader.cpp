#include "discovery/proc_arp_reader.hpp"

#include <sstream>

#include "lanlens_error_codes.hpp"
#include "util/mac_address.hpp"
#include "util/string_util.hpp"

namespace lanlens {

std::vector<data::ArpEntry> ProcArpReader::parse(std::string_view content) {
  std::vector<data::ArpEntry> entries;
  std::istringstream iss{std::string(content)};
  std::string line;
  bool header = true;
  while (std::getline(iss, line)) {
    if (header) {
      header = false;
      if (stringutil::starts_with(line, "IP address")) continue;
    }
    std::istringstream fields(line);
    std::string ip, hw_type, flags, hw_addr, mask, device;
    if (!(fields >> ip >> hw_type >> flags >> hw_addr >> mask >> device)) {
      continue;
    }
    if (flags == "0x0") continue;
    auto mac = macaddr::normalize(hw_addr);
    if (!mac || macaddr::is_broadcast_or_zero(*mac)) continue;
    entries.push_back(data::ArpEntry{ip, *mac, device});
  }
  return entries;
}

monad::MyResult<std::vector<data::ArpEntry>> ProcArpReader::read_table() {
  std::error_code ec;
  std::string content = stringutil::readFile(path_.string(), ec);
  if (ec) {
    return monad::MyResult<std::vector<data::ArpEntry>>::Err(monad::make_error(
        lanlens_errors::GENERAL::FILE_READ_WRITE,
        "Unable to read ARP table " + path_.string() + ": " + ec.message()));
  }
  return monad::MyResult<std::vector<data::ArpEntry>>::Ok(parse(content));
}

} // namespace lanlens
