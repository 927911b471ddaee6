#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>

#include "common_macros.hpp"
#include "lanlens_common.hpp"
#include "lanlens_entry.hpp"
#include "util/my_logging.hpp"
#include "version.h"

namespace po = boost::program_options;

namespace {

namespace js = boost::json;
namespace fs = std::filesystem;

struct DefaultPaths {
  fs::path config_dir;
  fs::path runtime_dir;
};

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// LANLENS_CONFIG_DIR and LANLENS_RUNTIME_DIR override the defaults
// /etc/lanlens and /var/lib/lanlens individually.
DefaultPaths resolve_default_paths() {
  fs::path config_dir = get_env_path("LANLENS_CONFIG_DIR");
  fs::path runtime_dir = get_env_path("LANLENS_RUNTIME_DIR");
  if (config_dir.empty()) {
    config_dir = "/etc/lanlens";
  }
  if (runtime_dir.empty()) {
    runtime_dir = "/var/lib/lanlens";
  }
  return {config_dir, runtime_dir};
}

void ensure_directory_exists(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::exists(dir)) {
    throw std::runtime_error(std::string("Failed to create directory '") +
                             dir.string() + "': " + ec.message());
  }
}

void write_json_if_missing(const fs::path &file_path,
                           const js::value &content) {
  if (fs::exists(file_path)) {
    return;
  }
  ensure_directory_exists(file_path.parent_path());
  std::ofstream ofs(file_path);
  if (!ofs) {
    throw std::runtime_error("Unable to write default config file: " +
                             file_path.string());
  }
  ofs << js::serialize(content) << std::endl;
}

bool bootstrap_default_config_dir(const fs::path &config_dir,
                                  const fs::path &runtime_dir) {
  std::error_code ec;
  fs::create_directories(config_dir, ec);
  if (ec && !fs::exists(config_dir)) {
    std::cerr << "Warning: unable to create default config directory '"
              << config_dir << "': " << ec.message() << std::endl;
    return false;
  }

  try {
    lanlens::LanlensConfig defaults;
    defaults.verbose = "info";
    defaults.runtime_dir = runtime_dir;
    write_json_if_missing(config_dir / "application.json",
                          js::value_from(defaults));

    lanlens::LoggingConfig log;
    log.log_dir = (runtime_dir / "logs").string();
    write_json_if_missing(config_dir / "log_config.json", js::value_from(log));
  } catch (const std::exception &ex) {
    std::cerr << "Warning: failed to write default configuration files: "
              << ex.what() << std::endl;
    return false;
  }
  return true;
}

// First runtime_dir named by any application*.json in the config
// directories.
std::optional<fs::path>
find_runtime_dir_override(const lanlens::ConfigSources &sources) {
  if (!sources.application_json || !sources.application_json->is_object()) {
    return std::nullopt;
  }
  if (auto *rd = sources.application_json->as_object().if_contains("runtime_dir")) {
    if (rd->is_string() && !rd->as_string().empty()) {
      return fs::path(std::string(rd->as_string()));
    }
  }
  return std::nullopt;
}

void add_unique_path(std::vector<fs::path> &paths, const fs::path &candidate) {
  if (candidate.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), candidate) == paths.end()) {
    paths.push_back(candidate);
  }
}

} // namespace

int RunLanlensApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--version" || arg == "version") {
      std::cout << LANLENS_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("lanlens: LAN device discovery");

    lanlens::CliParams cli_params;
    std::vector<std::string> config_dirs_args;
    int min_score = -1;

    generic_desc.add_options() //
        ("config-dirs,c",
         po::value<std::vector<std::string>>(&config_dirs_args)
             ->multitoken()
             ->composing(),
         "paths of the configuration directories.") //
        ("profiles",
         po::value<std::vector<std::string>>(&cli_params.profiles)
             ->default_value(std::vector<std::string>{}, "")
             ->multitoken(),
         "profiles to use from the configuration file.") //
        ("verbose,v",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress diagnostic output.") //
        ("offset", po::value<size_t>(&cli_params.offset)->default_value(0),
         "offset") //
        ("limit", po::value<size_t>(&cli_params.limit)->default_value(50),
         "limit") //
        ("format", po::value<std::string>(&cli_params.format)->default_value(""),
         "output format: table (default), json or csv.") //
        ("output,o", po::value<std::string>(&cli_params.output)->default_value(""),
         "export directory; '-' or empty writes to stdout.") //
        ("force", po::bool_switch(&cli_params.force)->default_value(false),
         "bypass fingerprint caches.") //
        ("min-score", po::value<int>(&min_score)->default_value(-1, ""),
         "smart score threshold for 'devices smart'.") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    if (min_score >= 0) {
      cli_params.min_score = min_score;
    }

    for (const auto &dir_str : config_dirs_args) {
      fs::path config_dir(dir_str);
      if (!fs::exists(config_dir)) {
        throw std::runtime_error("Config directory does not exist: " +
                                 config_dir.string());
      }
      cli_params.config_dirs.push_back(std::move(config_dir));
    }

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    std::vector<std::string> unrecognized = po::collect_unrecognized(
        parsed.options, po::collect_unrecognized_mode::include_positional);
    lanlens::normalize_cli_subcommand(cli_params.subcmd, positionals);

    auto showUsage = [&]() {
      std::cerr << generic_desc << std::endl;
      std::cerr << "Subcommands:" << std::endl
                << "  scan [quick|full|arp]   Discover devices on the LAN."
                << std::endl
                << "  listen [seconds]        Passive SSDP discovery." << std::endl
                << "  devices [list|smart|show|label|classify]" << std::endl
                << "                          Inspect known devices." << std::endl
                << "  export [json|csv]       Export the device inventory."
                << std::endl
                << "  cache [stats|clear|prune|invalidate]" << std::endl
                << "                          Manage caches and history."
                << std::endl
                << "  conf get|set <key>      Read or change settings."
                << std::endl
                << std::endl;
    };

    if (vm.count("help") || cli_params.subcmd.empty()) {
      showUsage();
      return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    const DefaultPaths defaults = resolve_default_paths();
    const bool default_config_available =
        bootstrap_default_config_dir(defaults.config_dir, defaults.runtime_dir);

    std::vector<fs::path> ordered_config_dirs;
    if (default_config_available && fs::exists(defaults.config_dir)) {
      add_unique_path(ordered_config_dirs, defaults.config_dir);
    }
    for (const auto &dir : cli_params.config_dirs) {
      add_unique_path(ordered_config_dirs, dir);
    }
    if (ordered_config_dirs.empty()) {
      std::cerr << "No configuration directories found. Provide --config-dirs"
                << " or ensure the default directory '" << defaults.config_dir
                << "' is accessible." << std::endl;
      return EXIT_FAILURE;
    }

    fs::path resolved_runtime_dir = defaults.runtime_dir;
    {
      lanlens::ConfigSources lookup_sources(ordered_config_dirs, cli_params.profiles);
      if (auto rd = find_runtime_dir_override(lookup_sources)) {
        resolved_runtime_dir = *rd;
      }
    }
    try {
      ensure_directory_exists(resolved_runtime_dir);
      ensure_directory_exists(resolved_runtime_dir / "logs");
    } catch (const std::exception &ex) {
      std::cerr << "Failed to prepare runtime directory '"
                << resolved_runtime_dir << "': " << ex.what() << std::endl;
      return EXIT_FAILURE;
    }

    add_unique_path(ordered_config_dirs, resolved_runtime_dir);
    cli_params.config_dirs = ordered_config_dirs;
    cli_params.runtime_dir = resolved_runtime_dir;

    std::map<std::string, std::string> cli_overrides{
        {"runtime_dir", resolved_runtime_dir.string()}};
    static lanlens::ConfigSources config_sources(
        cli_params.config_dirs, cli_params.profiles, std::move(cli_overrides));
    {
      auto log_config_result = config_sources.json_content("log_config");
      if (log_config_result.is_err()) {
        std::cerr << "Failed to load log_config: " << log_config_result.error()
                  << std::endl;
        return EXIT_FAILURE;
      }
      DEBUG_PRINT("log config: " << log_config_result.value());
      auto logging_config =
          js::value_to<lanlens::LoggingConfig>(log_config_result.value());
      lanlens::init_my_log(logging_config);
    }

    static lanlens::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                            std::move(unrecognized), std::move(cli_params));

    if (!cli_ctx.is_specified_by_user("verbose") &&
        config_sources.application_json) {
      auto config =
          js::value_to<lanlens::LanlensConfig>(*config_sources.application_json);
      if (!config.verbose.empty()) {
        cli_ctx.params.verbose = config.verbose;
      }
    }

    lanlens::App app(config_sources, cli_ctx);
    return app.start();
  } catch (const std::exception &e) {
    std::cerr << "error caught in main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunLanlensApplication(argc, argv); }
