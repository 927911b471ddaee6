#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "data/observations.hpp"
#include "result_monad.hpp"

namespace lanlens {

class IArpTableReader {
public:
  virtual ~IArpTableReader() = default;
  virtual monad::MyResult<std::vector<data::ArpEntry>> read_table() = 0;
};

// Reads the kernel neighbour table from /proc/net/arp.
class ProcArpReader : public IArpTableReader {
  std::filesystem::path path_;

public:
  explicit ProcArpReader(std::filesystem::path path = "/proc/net/arp")
      : path_(std::move(path)) {}

  monad::MyResult<std::vector<data::ArpEntry>> read_table() override;

  // Skips the header, incomplete entries (flags 0x0), and the zero or
  // broadcast MAC. MACs come back normalized.
  static std::vector<data::ArpEntry> parse(std::string_view content);
};

} // namespace lanlens
