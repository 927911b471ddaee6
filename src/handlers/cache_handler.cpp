#include "handlers/cache_handler.hpp"

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace lanlens {

std::string CacheHandler::print_opt_desc() {
  return "Usage:\n"
         "  lanlens cache stats\n"
         "  lanlens cache clear             drop ARP and fingerprint caches\n"
         "  lanlens cache prune             expired fingerprints, old presence\n"
         "  lanlens cache invalidate <mac>  forget one device's fingerprint\n";
}

monad::MyVoidResult CacheHandler::start() {
  const auto action = cli_ctx_.positional_at(1).value_or("stats");
  if (action == "stats") {
    return show_stats();
  }
  if (action == "clear") {
    arp_cache_.clear();
    fingerprint_cache_.clear();
    output_.info() << "ARP and fingerprint caches cleared" << std::endl;
    return monad::MyVoidResult::Ok();
  }
  if (action == "prune") {
    auto fingerprints = fingerprint_cache_.prune();
    auto presence = behavior_.prune_old_records();
    output_.info() << fmt::format(
                          "Pruned {} fingerprint entries and {} presence records",
                          fingerprints, presence)
                   << std::endl;
    return monad::MyVoidResult::Ok();
  }
  if (action == "invalidate") {
    auto mac = cli_ctx_.positional_at(2);
    if (!mac) {
      return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::GENERAL::SHOW_OPT_DESC,
                                        print_opt_desc()));
    }
    fingerprint_cache_.invalidate(*mac);
    output_.info() << "Fingerprint cache entry for " << *mac << " dropped"
                   << std::endl;
    return monad::MyVoidResult::Ok();
  }
  return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::GENERAL::SHOW_OPT_DESC,
                                    print_opt_desc()));
}

monad::MyVoidResult CacheHandler::show_stats() {
  auto &out = output_.out();
  auto arp = arp_cache_.stats();
  out << fmt::format("ARP cache           {} entries, {} hits, {} misses, "
                     "{} refreshes\n",
                     arp.entry_count, arp.hits, arp.misses, arp.refresh_count);

  auto upnp = fingerprint_cache_.upnp_stats();
  out << fmt::format("UPnP descriptions   {} entries, {} hits, {} misses\n",
                     upnp.entry_count, upnp.hits, upnp.misses);

  auto remote = fingerprint_cache_.remote_stats();
  if (remote.is_err()) {
    output_.warning() << "Fingerprint cache unavailable: "
                      << remote.error().what << std::endl;
  } else {
    const auto &s = remote.value();
    out << fmt::format("Fingerprint cache   {} entries ({} valid), hit rate "
                       "{:.1f}%, last prune {}\n",
                       s.total_entries, s.valid_entries, s.hit_rate() * 100.0,
                       s.last_prune_at ? stringutil::formatISO8601(*s.last_prune_at)
                                       : std::string("never"));
  }

  auto meta = bundled_.metadata();
  if (meta.is_loaded) {
    out << fmt::format("Bundled database    v{}, {} entries\n", meta.version,
                       meta.entry_count);
  } else {
    out << fmt::format("Bundled database    not loaded ({})\n",
                       meta.load_error.value_or("missing"));
  }
  out.flush();
  return monad::MyVoidResult::Ok();
}

} // namespace lanlens
