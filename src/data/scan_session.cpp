#include "data/scan_session.hpp"

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace lanlens::data {

std::string to_string(ScanType t) {
  switch (t) {
  case ScanType::full:
    return "full";
  case ScanType::passive:
    return "passive";
  case ScanType::quick:
    break;
  }
  return "quick";
}

std::string to_string(ScanErrorSource s) {
  switch (s) {
  case ScanErrorSource::arpScanner:
    return "ARPScanner";
  case ScanErrorSource::portScanner:
    return "PortScanner";
  case ScanErrorSource::mdnsListener:
    return "MDNSListener";
  case ScanErrorSource::ssdpListener:
    return "SSDPListener";
  case ScanErrorSource::fingerprinting:
    return "Fingerprinting";
  case ScanErrorSource::permission:
    return "Permission";
  case ScanErrorSource::network:
    break;
  }
  return "Network";
}

ScanSession ScanSession::begin(ScanType type,
                               std::chrono::system_clock::time_point now) {
  ScanSession s{};
  s.id = stringutil::generate_uuid();
  s.start_time = now;
  s.type = type;
  return s;
}

void ScanSession::add_error(ScanErrorSource source, std::string message,
                            std::optional<int> code, bool recoverable,
                            std::chrono::system_clock::time_point now) {
  errors.push_back(ScanError{.timestamp = now,
                             .source = source,
                             .message = std::move(message),
                             .code = code,
                             .is_recoverable = recoverable});
}

std::optional<std::string> ScanSession::formatted_duration() const {
  auto d = duration();
  if (!d) return std::nullopt;
  double secs = d->count();
  if (secs < 1.0) {
    return fmt::format("{:.0f} ms", secs * 1000.0);
  }
  if (secs < 60.0) {
    return fmt::format("{:.1f} sec", secs);
  }
  auto whole = static_cast<int64_t>(secs);
  return fmt::format("{}m {}s", whole / 60, whole % 60);
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const ScanSession &s) {
  json::array errors;
  for (const auto &e : s.errors) {
    json::object eo{{"timestamp", stringutil::formatISO8601(e.timestamp)},
                    {"source", to_string(e.source)},
                    {"message", e.message},
                    {"isRecoverable", e.is_recoverable}};
    if (e.code) eo["code"] = *e.code;
    errors.push_back(std::move(eo));
  }
  json::object jo{{"id", s.id},
                  {"type", to_string(s.type)},
                  {"startTime", stringutil::formatISO8601(s.start_time)},
                  {"discoveredCount", s.discovered_count},
                  {"updatedCount", s.updated_count},
                  {"errors", std::move(errors)}};
  if (s.end_time) jo["endTime"] = stringutil::formatISO8601(*s.end_time);
  if (auto fd = s.formatted_duration()) jo["duration"] = *fd;
  jv = std::move(jo);
}

} // namespace lanlens::data
