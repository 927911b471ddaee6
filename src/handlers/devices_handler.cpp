#include "handlers/devices_handler.hpp"

#include <fmt/format.h>

#include "export/device_exporter.hpp"
#include "handlers/device_table.hpp"
#include "util/string_util.hpp"

namespace lanlens {

std::string DevicesHandler::print_opt_desc() {
  return "Usage:\n"
         "  lanlens devices [list] [--offset N] [--limit N] [--format json]\n"
         "  lanlens devices smart [--min-score N]\n"
         "  lanlens devices show <mac>\n"
         "  lanlens devices label <mac> [text]   (no text clears the label)\n"
         "  lanlens devices classify <mac>\n";
}

monad::MyVoidResult DevicesHandler::start() {
  if (auto loaded = registry_.load_from_store(); loaded.is_err()) {
    return monad::MyVoidResult::Err(loaded.error());
  }
  const auto action = cli_ctx_.positional_at(1).value_or("list");
  if (action == "list") {
    return handle_list(registry_.get_all_devices());
  }
  if (action == "smart") {
    return handle_list(registry_.get_smart_devices(cli_ctx_.params.min_score));
  }

  auto mac = cli_ctx_.positional_at(2);
  if (!mac) {
    return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::GENERAL::SHOW_OPT_DESC,
                                      print_opt_desc()));
  }
  if (action == "show") {
    return handle_show(*mac);
  }
  if (action == "label") {
    return handle_label(*mac);
  }
  if (action == "classify") {
    return handle_classify(*mac);
  }
  return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::GENERAL::SHOW_OPT_DESC,
                                    print_opt_desc()));
}

monad::MyVoidResult DevicesHandler::handle_list(std::vector<data::Device> devices) {
  auto [offset, limit] = cli_ctx_.offset_limit();
  if (offset >= devices.size()) {
    devices.clear();
  } else {
    auto first = devices.begin() + static_cast<std::ptrdiff_t>(offset);
    auto last = first + static_cast<std::ptrdiff_t>(
                            std::min(limit, devices.size() - offset));
    devices = std::vector<data::Device>(first, last);
  }
  if (cli_ctx_.params.format == "json") {
    output_.out() << DeviceExporter::pretty_json(json::value_from(devices))
                  << std::endl;
  } else {
    print_device_table(output_, devices);
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult DevicesHandler::handle_show(const std::string &mac) {
  auto device = registry_.get_device(mac);
  if (!device) {
    return monad::MyVoidResult::Err(
        monad::make_error(lanlens_errors::GENERAL::NOT_FOUND, "Unknown device " + mac));
  }
  if (cli_ctx_.params.format == "json") {
    output_.out() << DeviceExporter::pretty_json(json::value_from(*device))
                  << std::endl;
  } else {
    print_device_detail(output_, *device);
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult DevicesHandler::handle_label(const std::string &mac) {
  std::optional<std::string> label;
  if (cli_ctx_.positional_count() > 3) {
    std::vector<std::string> words(cli_ctx_.positionals.begin() + 3,
                                   cli_ctx_.positionals.end());
    label = stringutil::join(words, " ");
  }
  if (auto r = registry_.set_user_label(mac, label); r.is_err()) {
    return r;
  }
  registry_.flush_events();
  output_.info() << (label ? fmt::format("Labelled {} as \"{}\"", mac, *label)
                           : fmt::format("Cleared label of {}", mac))
                 << std::endl;
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult DevicesHandler::handle_classify(const std::string &mac) {
  auto r = registry_.reclassify(mac);
  if (r.is_err()) {
    return monad::MyVoidResult::Err(r.error());
  }
  registry_.flush_events();
  output_.out() << fmt::format("{}  {}  confidence {:.2f}", mac,
                               data::to_string(r.value().type),
                               r.value().confidence)
                << std::endl;
  return monad::MyVoidResult::Ok();
}

} // namespace lanlens
