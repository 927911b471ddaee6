#pragma once

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "boost/di.hpp"
#include "behavior/behavior_tracker.hpp"
#include "cache/arp_cache.hpp"
#include "cache/fingerprint_cache.hpp"
#include "conf/config_sources.hpp"
#include "conf/lanlens_config.hpp"
#include "customio/console_output.hpp"
#include "discovery/device_registry.hpp"
#include "discovery/port_scanner.hpp"
#include "discovery/proc_arp_reader.hpp"
#include "discovery/ssdp_search.hpp"
#include "export/device_exporter.hpp"
#include "fingerprint/fingerbank_client.hpp"
#include "fingerprint/fingerprint_pipeline.hpp"
#include "fingerprint/http_fetch.hpp"
#include "fingerprint/upnp_description_fetcher.hpp"
#include "handlers/cache_handler.hpp"
#include "handlers/conf_handler.hpp"
#include "handlers/devices_handler.hpp"
#include "handlers/export_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/listen_handler.hpp"
#include "handlers/scan_handler.hpp"
#include "lanlens_common.hpp"
#include "state/bundled_database.hpp"
#include "state/device_store.hpp"
#include "state/fingerprint_cache_store.hpp"
#include "state/presence_store.hpp"
#include "version.h"

namespace di = boost::di;
namespace lanlens {

// Binds every interface to its production implementation. Handlers are
// created per dispatch; everything they depend on is a singleton for the
// lifetime of the injector.
inline auto make_app_injector(ConfigSources &config_sources, CliCtx &cli_ctx,
                              customio::ConsoleOutput &output,
                              ILanlensConfigProvider &config_provider,
                              IArpTableReader &arp_reader,
                              IHttpTransport &transport,
                              IUpnpDescriptionFetcher &upnp_fetcher,
                              IBundledDatabase &bundled) {
  auto handler_module = []() {
    return di::make_injector(
        di::bind<ScanHandler>().in(di::unique),
        di::bind<ListenHandler>().in(di::unique),
        di::bind<DevicesHandler>().in(di::unique),
        di::bind<ExportHandler>().in(di::unique),
        di::bind<CacheHandler>().in(di::unique),
        di::bind<ConfHandler>().in(di::unique),
        di::bind<IHandlerFactory>().to(
            [](const auto &inj) -> IHandlerFactory & {
              static HandlerFactoryImpl factory(
                  [&inj](const std::string &subcmd) -> std::shared_ptr<IHandler> {
                    if (subcmd == "scan") {
                      return inj.template create<std::shared_ptr<ScanHandler>>();
                    } else if (subcmd == "listen") {
                      return inj.template create<std::shared_ptr<ListenHandler>>();
                    } else if (subcmd == "devices") {
                      return inj.template create<std::shared_ptr<DevicesHandler>>();
                    } else if (subcmd == "export") {
                      return inj.template create<std::shared_ptr<ExportHandler>>();
                    } else if (subcmd == "cache") {
                      return inj.template create<std::shared_ptr<CacheHandler>>();
                    } else if (subcmd == "conf") {
                      return inj.template create<std::shared_ptr<ConfHandler>>();
                    }
                    throw std::runtime_error("Unsupported subcommand: " + subcmd);
                  });
              return factory;
            }));
  };

  return di::make_injector(
      handler_module(),                                   //
      di::bind<ConfigSources>().to(config_sources),       //
      di::bind<CliCtx>().to(cli_ctx),                     //
      di::bind<customio::ConsoleOutput>().to(output),     //
      di::bind<ILanlensConfigProvider>().to(config_provider),
      di::bind<IArpTableReader>().to(arp_reader),         //
      di::bind<IHttpTransport>().to(transport),           //
      di::bind<IUpnpDescriptionFetcher>().to(upnp_fetcher),
      di::bind<IBundledDatabase>().to(bundled),           //
      di::bind<IPortScanner>().to<AsioPortScanner>(),     //
      di::bind<ISsdpSearcher>().to<AsioSsdpSearcher>(),         //
      di::bind<IFingerbankClient>().to<FingerbankClient>(),
      di::bind<IFingerprintCacheStore>().to<SqliteFingerprintCacheStore>(),
      di::bind<IFingerprintPipeline>().to<FingerprintPipeline>(),
      di::bind<IPresenceStore>().to<SqlitePresenceStore>(),
      di::bind<IDeviceStore>().to<SqliteDeviceStore>());
}

class App {
  ConfigSources &config_sources_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput *output_;

public:
  App(ConfigSources &config_sources, CliCtx &cli_ctx)
      : config_sources_(config_sources), cli_ctx_(cli_ctx) {
    static customio::ConsoleOutput output_hub(cli_ctx.verbosity_level());
    output_ = &output_hub;
  }

  void print_error(const monad::Error &err) {
    if (err.code == lanlens_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else {
      output_->printer().red(fmt::format("Error({}): {}", err.code, err.what));
    }
  }

  int start() {
    // Injector singletons are process-wide statics; everything bound by
    // reference has to outlive them.
    static LanlensConfigProviderFile config_provider(config_sources_);
    const auto &config = config_provider.get();

    static ProcArpReader arp_reader;
    static BeastHttpTransport transport;
    static HttpUpnpDescriptionFetcher upnp_fetcher(
        transport, std::chrono::seconds(config.discovery.upnp_timeout_seconds));
    static SqliteBundledDatabase bundled(config.bundled_database_path());

    auto injector =
        make_app_injector(config_sources_, cli_ctx_, *output_, config_provider,
                          arp_reader, transport, upnp_fetcher, bundled);

    output_->debug() << "lanlens " << LANLENS_VERSION << std::endl;
    output_->debug() << "Config source directories:" << std::endl;
    for (const auto &source : config_sources_.paths_) {
      output_->debug() << " - " << source.string() << std::endl;
    }
    output_->debug() << "Runtime directory: " << config.runtime_dir.string()
                     << std::endl;

    auto &dispatcher = injector.template create<HandlerDispatcher &>();
    int exit_code = EXIT_SUCCESS;
    bool dispatched =
        dispatcher.dispatch_run(cli_ctx_.params.subcmd, [&](monad::MyVoidResult &&r) {
          if (r.is_err()) {
            print_error(r.error());
            exit_code = EXIT_FAILURE;
          } else {
            output_->debug() << "Handler completed successfully." << std::endl;
          }
        });

    if (!dispatched) {
      output_->error() << "No valid subcommand provided. Available: scan, "
                          "listen, devices, export, cache, conf."
                       << std::endl;
      return EXIT_FAILURE;
    }

    if (cli_ctx_.params.subcmd != "conf") {
      auto &registry = injector.template create<DeviceRegistry &>();
      registry.stop_passive_discovery();
      registry.flush_events();
      auto flushed = injector.template create<BehaviorTracker &>().flush_pending();
      if (flushed.is_err()) {
        output_->warning() << "Presence history not saved: "
                           << flushed.error().what << std::endl;
      }
    }
    return exit_code;
  }
};

} // namespace lanlens
