#include "handlers/device_table.hpp"

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace lanlens {

void print_device_table(customio::ConsoleOutput &output,
                        const std::vector<data::Device> &devices) {
  auto &out = output.out();
  out << fmt::format("{:<17}  {:<15}  {:<11}  {:>5}  {:<7}  {}\n", "MAC", "IP",
                     "TYPE", "SCORE", "STATE", "NAME");
  for (const auto &d : devices) {
    out << fmt::format("{:<17}  {:<15}  {:<11}  {:>5}  ", d.mac, d.ip,
                       data::to_string(d.device_type), d.smart_score);
    if (d.is_online) {
      output.printer().green() << fmt::format("{:<7}", "online");
    } else {
      output.printer().dim() << fmt::format("{:<7}", "offline");
    }
    out << "  " << d.display_name() << "\n";
  }
  out << fmt::format("{} device(s)", devices.size()) << std::endl;
}

void print_device_detail(customio::ConsoleOutput &output,
                         const data::Device &d) {
  auto &out = output.out();
  output.printer().bold() << d.display_name() << std::endl;
  out << fmt::format("  MAC         {}\n", d.mac);
  out << fmt::format("  IP          {}\n", d.ip);
  out << fmt::format("  Hostname    {}\n", d.hostname.value_or("-"));
  out << fmt::format("  Vendor      {}\n", d.vendor.value_or("-"));
  out << fmt::format("  Type        {}\n", data::to_string(d.device_type));
  out << fmt::format("  Label       {}\n", d.user_label.value_or("-"));
  out << fmt::format("  Smart score {}\n", d.smart_score);
  out << fmt::format("  First seen  {}\n", stringutil::formatISO8601(d.first_seen));
  out << fmt::format("  Last seen   {}\n", stringutil::formatISO8601(d.last_seen));
  out << fmt::format("  State       {}\n", d.is_online ? "online" : "offline");
  if (!d.open_ports.empty()) {
    out << "  Ports\n";
    for (const auto &p : d.open_ports) {
      out << fmt::format("    {:>5}/{}  {}{}\n", p.number,
                         p.protocol == data::TransportProtocol::tcp ? "tcp" : "udp",
                         p.service_name.value_or("unknown"),
                         p.banner ? "  [" + *p.banner + "]" : std::string{});
    }
  }
  if (!d.services.empty()) {
    out << "  Services\n";
    for (const auto &s : d.services) {
      out << "    " << s.name;
      if (s.port) out << " :" << *s.port;
      out << "\n";
    }
  }
  if (!d.smart_signals.empty()) {
    out << "  Signals\n";
    for (const auto &s : d.smart_signals) {
      out << fmt::format("    +{:<3} {}\n", s.weight, s.description);
    }
  }
  if (d.fingerprint) {
    const auto &fp = *d.fingerprint;
    out << fmt::format("  Fingerprint ({}{})\n", data::to_string(fp.source),
                       fp.cache_hit ? ", cached" : "");
    if (auto name = fp.best_name()) out << "    Name         " << *name << "\n";
    if (auto mf = fp.best_manufacturer()) out << "    Manufacturer " << *mf << "\n";
    if (fp.model_name) out << "    Model        " << *fp.model_name << "\n";
    if (fp.operating_system) {
      out << "    OS           " << *fp.operating_system;
      if (fp.os_version && *fp.os_version != *fp.operating_system)
        out << " " << *fp.os_version;
      out << "\n";
    }
  }
  out.flush();
}

void print_session_summary(customio::ConsoleOutput &output,
                           const data::ScanSession &session) {
  auto &out = output.out();
  out << fmt::format("Scan {} ({}) finished in {}\n", session.id,
                     data::to_string(session.type),
                     session.formatted_duration().value_or("-"));
  out << fmt::format("  discovered {}, updated {}, errors {}\n",
                     session.discovered_count, session.updated_count,
                     session.errors.size());
  for (const auto &e : session.errors) {
    output.printer().yellow() << fmt::format("  [{}] {}", data::to_string(e.source),
                                             e.message)
                              << std::endl;
  }
  out.flush();
}

} // namespace lanlens
