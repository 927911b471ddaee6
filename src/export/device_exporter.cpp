#include "export/device_exporter.hpp"

#include <algorithm>
#include <fstream>

#include "lanlens_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

namespace json = boost::json;

namespace {

void indent(std::string &out, int level) { out.append(level * 2, ' '); }

void write_pretty(std::string &out, const json::value &jv, int level) {
  switch (jv.kind()) {
  case json::kind::object: {
    const auto &obj = jv.get_object();
    if (obj.empty()) {
      out += "{}";
      return;
    }
    std::vector<std::string_view> keys;
    keys.reserve(obj.size());
    for (const auto &kv : obj) keys.push_back(kv.key());
    std::sort(keys.begin(), keys.end());
    out += "{\n";
    for (size_t i = 0; i < keys.size(); ++i) {
      indent(out, level + 1);
      out += json::serialize(json::string(keys[i]));
      out += " : ";
      write_pretty(out, obj.at(keys[i]), level + 1);
      if (i + 1 < keys.size()) out += ",";
      out += "\n";
    }
    indent(out, level);
    out += "}";
    return;
  }
  case json::kind::array: {
    const auto &arr = jv.get_array();
    if (arr.empty()) {
      out += "[]";
      return;
    }
    out += "[\n";
    for (size_t i = 0; i < arr.size(); ++i) {
      indent(out, level + 1);
      write_pretty(out, arr[i], level + 1);
      if (i + 1 < arr.size()) out += ",";
      out += "\n";
    }
    indent(out, level);
    out += "]";
    return;
  }
  default:
    out += json::serialize(jv);
  }
}

} // namespace

std::string to_string(ExportFormat f) {
  return f == ExportFormat::json ? "json" : "csv";
}

std::optional<ExportFormat> export_format_from_string(const std::string &s) {
  auto lower = stringutil::toLowerCase(s);
  if (lower == "json") return ExportFormat::json;
  if (lower == "csv") return ExportFormat::csv;
  return std::nullopt;
}

std::string file_extension(ExportFormat f) { return to_string(f); }

std::string mime_type(ExportFormat f) {
  return f == ExportFormat::json ? "application/json" : "text/csv";
}

std::string DeviceExporter::escape_csv(const std::string &value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) {
    return value;
  }
  return "\"" + stringutil::replace_all(value, "\"", "\"\"") + "\"";
}

std::string DeviceExporter::to_csv(const std::vector<data::Device> &devices) {
  std::vector<std::string> lines{
      "MAC,IP,Hostname,Vendor,Type,Label,SmartScore,FirstSeen,LastSeen,Online"};
  for (const auto &d : devices) {
    lines.push_back(stringutil::join(
        {escape_csv(d.mac), escape_csv(d.ip), escape_csv(d.hostname.value_or("")),
         escape_csv(d.vendor.value_or("")), data::to_string(d.device_type),
         escape_csv(d.user_label.value_or("")), std::to_string(d.smart_score),
         stringutil::formatISO8601(d.first_seen),
         stringutil::formatISO8601(d.last_seen), d.is_online ? "true" : "false"},
        ","));
  }
  return stringutil::join(lines, "\n");
}

std::string DeviceExporter::pretty_json(const json::value &jv) {
  std::string out;
  write_pretty(out, jv, 0);
  return out;
}

monad::MyResult<std::string>
DeviceExporter::export_devices(const std::vector<data::Device> &devices,
                               ExportFormat format) const {
  BOOST_LOG_SEV(lg_, trivial::info) << "Exporting " << devices.size()
                                    << " devices as " << to_string(format);
  std::string body;
  if (format == ExportFormat::json) {
    json::object wrapper{
        {"exportDate", stringutil::formatISO8601(clock_())},
        {"deviceCount", devices.size()},
        {"devices", json::value_from(devices)}};
    body = pretty_json(wrapper);
  } else {
    body = to_csv(devices);
  }
  BOOST_LOG_SEV(lg_, trivial::debug) << "Export complete: " << body.size()
                                     << " bytes";
  return monad::MyResult<std::string>::Ok(std::move(body));
}

monad::MyResult<std::filesystem::path>
DeviceExporter::export_to_file(const std::vector<data::Device> &devices,
                               ExportFormat format,
                               const std::filesystem::path &directory) const {
  using R = monad::MyResult<std::filesystem::path>;
  if (devices.empty()) {
    return R::Err(monad::make_error(lanlens_errors::EXPORT::NO_DEVICES,
                             "No devices to export"));
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    return R::Err(monad::make_error(lanlens_errors::EXPORT::WRITE_FAILED,
                             "Invalid export directory: " + directory.string()));
  }
  auto body = export_devices(devices, format);
  if (body.is_err()) {
    return R::Err(body.error());
  }

  auto timestamp =
      stringutil::replace_all(stringutil::formatISO8601(clock_()), ":", "-");
  auto target = directory / fmt::format("lanlens-export-{}.{}", timestamp,
                                        file_extension(format));
  auto tmp = target;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      return R::Err(monad::make_error(lanlens_errors::EXPORT::WRITE_FAILED,
                               "Unable to open " + tmp.string()));
    }
    ofs << body.value();
    if (!ofs) {
      return R::Err(monad::make_error(lanlens_errors::EXPORT::WRITE_FAILED,
                               "Unable to write " + tmp.string()));
    }
  }
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    BOOST_LOG_SEV(lg_, trivial::error) << "Failed to write export file "
                                       << target.string();
    return R::Err(monad::make_error(lanlens_errors::EXPORT::WRITE_FAILED,
                             "Unable to write " + target.string()));
  }
  BOOST_LOG_SEV(lg_, trivial::info) << "Wrote export file " << target.string();
  return R::Ok(target);
}

} // namespace lanlens
