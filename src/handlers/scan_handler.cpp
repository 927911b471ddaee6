#include "handlers/scan_handler.hpp"

#include "export/device_exporter.hpp"
#include "handlers/device_table.hpp"

namespace lanlens {

std::string ScanHandler::print_opt_desc() {
  return "Usage:\n"
         "  lanlens scan [quick|full|arp] [--format json]\n"
         "    quick  ARP table plus the common smart-device ports (default)\n"
         "    full   ARP table plus the full smart-device port list\n"
         "    arp    ARP table only\n";
}

monad::MyVoidResult ScanHandler::start() {
  const auto mode = cli_ctx_.positional_at(1).value_or("quick");
  if (mode != "quick" && mode != "full" && mode != "arp") {
    return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::GENERAL::SHOW_OPT_DESC,
                                      print_opt_desc()));
  }

  if (auto loaded = registry_.load_from_store(); loaded.is_err()) {
    output_.warning() << "Previous devices not restored: "
                      << loaded.error().what << std::endl;
  }

  output_.info() << "Running " << mode << " scan..." << std::endl;
  data::ScanSession session;
  if (mode == "full") {
    session = registry_.run_full_scan();
  } else if (mode == "arp") {
    session = registry_.run_arp_scan();
  } else {
    session = registry_.run_quick_scan();
  }
  if (!registry_.wait_for_fingerprints(std::chrono::seconds(30))) {
    output_.warning() << "Some fingerprint lookups are still running"
                      << std::endl;
  }
  registry_.flush_events();

  auto devices = registry_.get_all_devices();
  if (cli_ctx_.params.format == "json") {
    json::object body{{"session", json::value_from(session)},
                      {"devices", json::value_from(devices)}};
    output_.out() << DeviceExporter::pretty_json(body) << std::endl;
  } else {
    print_session_summary(output_, session);
    print_device_table(output_, devices);
  }

  if (session.errors.size() > 0 && session.discovered_count == 0 &&
      session.updated_count == 0) {
    return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::NETWORK::SOCKET_ERROR,
                                      session.errors.front().message));
  }
  return monad::MyVoidResult::Ok();
}

} // namespace lanlens
