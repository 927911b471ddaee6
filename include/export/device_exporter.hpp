#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "data/device.hpp"
#include "result_monad.hpp"
#include "util/clock.hpp"

namespace lanlens {

enum class ExportFormat { json, csv };

std::string to_string(ExportFormat f);
std::optional<ExportFormat> export_format_from_string(const std::string &s);
std::string file_extension(ExportFormat f);
std::string mime_type(ExportFormat f);

/**
 * Writes the device inventory as JSON ({exportDate, deviceCount, devices},
 * pretty printed with sorted keys) or CSV (RFC 4180 quoting, "\n" line
 * separator, no trailing newline).
 */
class DeviceExporter {
public:
  void set_clock(WallClock clock) { clock_ = std::move(clock); }

  monad::MyResult<std::string> export_devices(const std::vector<data::Device> &devices,
                                     ExportFormat format) const;

  // Creates lanlens-export-<timestamp>.<ext> in `directory`. An empty device
  // list is rejected.
  monad::MyResult<std::filesystem::path>
  export_to_file(const std::vector<data::Device> &devices, ExportFormat format,
                 const std::filesystem::path &directory) const;

  static std::string escape_csv(const std::string &value);
  static std::string to_csv(const std::vector<data::Device> &devices);
  static std::string pretty_json(const boost::json::value &jv);

private:
  WallClock clock_{system_wall_clock()};
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;
};

} // namespace lanlens
