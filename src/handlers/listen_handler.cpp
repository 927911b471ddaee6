#include "handlers/listen_handler.hpp"

#include <fmt/format.h>

#include <charconv>
#include <memory>
#include <mutex>
#include <thread>

#include "handlers/device_table.hpp"

namespace lanlens {

namespace {
constexpr int kDefaultListenSeconds = 30;
}

std::string ListenHandler::print_opt_desc() {
  return "Usage:\n"
         "  lanlens listen [seconds]\n"
         "    Listens for SSDP announcements, 30 seconds by default.\n";
}

monad::MyVoidResult ListenHandler::start() {
  int seconds = kDefaultListenSeconds;
  if (auto arg = cli_ctx_.positional_at(1)) {
    auto [ptr, ec] =
        std::from_chars(arg->data(), arg->data() + arg->size(), seconds);
    if (ec != std::errc() || ptr != arg->data() + arg->size() || seconds <= 0) {
      return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::GENERAL::SHOW_OPT_DESC,
                                        print_opt_desc()));
    }
  }

  if (auto loaded = registry_.load_from_store(); loaded.is_err()) {
    output_.warning() << "Previous devices not restored: "
                      << loaded.error().what << std::endl;
  }

  auto print_mutex = std::make_shared<std::mutex>();
  auto id = registry_.subscribe(
      [this, print_mutex](const std::vector<data::DeviceEvent> &batch) {
        std::scoped_lock lock(*print_mutex);
        for (const auto &ev : batch) {
          output_.out() << fmt::format("{:<12} {}  {}  {}\n",
                                       data::to_string(ev.kind), ev.device.mac,
                                       ev.device.ip, ev.device.display_name());
        }
        output_.out().flush();
      });

  if (!registry_.start_passive_discovery()) {
    registry_.unsubscribe(id);
    return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::GENERAL::INVALID_ARGUMENT,
                                      "Passive discovery is already running"));
  }
  output_.info() << "Listening for " << seconds << " seconds..." << std::endl;
  std::this_thread::sleep_for(std::chrono::seconds(seconds));
  registry_.stop_passive_discovery();
  registry_.wait_for_fingerprints(std::chrono::seconds(10));
  registry_.flush_events();
  registry_.unsubscribe(id);

  print_device_table(output_, registry_.get_smart_devices());
  return monad::MyVoidResult::Ok();
}

} // namespace lanlens
