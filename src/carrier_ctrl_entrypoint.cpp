#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

#include "carrier_ctrl_entry.hpp"
#include "carrierctrl_common.hpp"
#include "common_macros.hpp"
#include "conf/config_sources.hpp"
#include "util/my_logging.hpp"
#include "version.h"

namespace po = boost::program_options;

namespace {

namespace js = boost::json;

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

// Precedence: CARRIERCTRL_CONFIG_DIR / CARRIERCTRL_RUNTIME_DIR, then
// CARRIERCTRL_BASE_DIR (config/ and runtime/ below it), then per-user
// defaults under $XDG_CONFIG_HOME / $XDG_STATE_HOME (or ~/.config, ~/.local).
DefaultPaths resolve_default_paths() {
  fs::path config_override = get_env_path("CARRIERCTRL_CONFIG_DIR");
  fs::path runtime_override = get_env_path("CARRIERCTRL_RUNTIME_DIR");

  if (!config_override.empty() && !runtime_override.empty()) {
    return {config_override, runtime_override};
  }

  fs::path base_override = get_env_path("CARRIERCTRL_BASE_DIR");
  if (!base_override.empty()) {
    return {config_override.empty() ? (base_override / "config")
                                    : config_override,
            runtime_override.empty() ? (base_override / "runtime")
                                     : runtime_override};
  }

#if defined(__APPLE__)
  fs::path home = get_env_path("HOME");
  fs::path base = home / "Library/Application Support/carrierctrl";
  return {config_override.empty() ? (base / "config") : config_override,
          runtime_override.empty() ? (base / "runtime") : runtime_override};
#else
  fs::path home = get_env_path("HOME");
  fs::path xdg_config = get_env_path("XDG_CONFIG_HOME");
  fs::path xdg_state = get_env_path("XDG_STATE_HOME");
  if (xdg_config.empty()) {
    xdg_config = home / ".config";
  }
  if (xdg_state.empty()) {
    xdg_state = home / ".local/state";
  }
  return {config_override.empty() ? (xdg_config / "carrierctrl")
                                  : config_override,
          runtime_override.empty() ? (xdg_state / "carrierctrl")
                                   : runtime_override};
#endif
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
    js::object application{
        {"verbose", "info"},
        {"worker_threads", 2},
        {"io_threads", 1},
        {"install_check", js::object{{"pattern", "SIM is ready"},
                                     {"syntax", "substring"},
                                     {"scope", "all"},
                                     {"case_sensitive", false},
                                     {"timeout_seconds", 40}}},
        {"installer", js::object{{"completion_field", "Status"},
                                 {"completion_value", "Completed"},
                                 {"package_type", "CarrierBundle"},
                                 {"staging_dir", "PublicStaging"},
                                 {"completion_timeout_seconds", 600}}},
        {"runtime_dir", runtime_dir.string()}};
    write_json_if_missing(config_dir / "application.json", application);

    js::object log{{"level", "info"},
                   {"log_dir", (runtime_dir / "logs").string()},
                   {"log_file", "carrierctrl.log"},
                   {"rotation_size", 10 * 1024 * 1024},
                   {"console", true}};
    write_json_if_missing(config_dir / "log_config.json", log);
  } catch (const std::exception &ex) {
    std::cerr << "Warning: failed to write default configuration files: "
              << ex.what() << std::endl;
    return false;
  }
  return true;
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

int RunCarrierCtrlApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--version" || arg == "version") {
      std::cout << MYAPP_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("carrierctrl: carrier bundle tool");

    carrierctrl::CliParams cli_params;
    std::vector<std::string> config_dirs_args;

    generic_desc.add_options() //
        ("config-dirs,c",
         po::value<std::vector<std::string>>(&config_dirs_args)
             ->multitoken()
             ->composing(),
         "paths of the configuration directories.") //
        ("profiles",
         po::value<std::vector<std::string>>(&cli_params.profiles)
             ->default_value(std::vector<std::string>{}, "")
             ->notifier([&](const std::vector<std::string> &profiles) mutable {
               if (profiles.empty()) {
                 cli_params.profiles.push_back("default");
               }
             }),
         "profiles to use from the configuration file.") //
        ("verbose,v",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all console output except events.") //
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
    if (!positionals.empty()) {
      cli_params.subcmd = positionals[0];
    }
    std::vector<std::string> unrecognized = po::collect_unrecognized(
        parsed.options, po::collect_unrecognized_mode::include_positional);
    carrierctrl::normalize_cli_subcommand(cli_params.subcmd, positionals);

    if (vm.count("help")) {
      std::cerr << generic_desc << std::endl;
      std::cerr << "Subcommands:" << std::endl
                << "  monitor   Publish device connection and summary events."
                << std::endl
                << "  install   Install a carrier bundle (.ipcc) on the "
                   "attached device."
                << std::endl
                << "  check     Wait for the SIM ready message after an "
                   "install."
                << std::endl
                << "  conf      Get or set persistent settings." << std::endl
                << std::endl
                << "Events are written to stdout as JSON lines." << std::endl;
      return EXIT_SUCCESS;
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

    // runtime_dir pinned in application*.json wins over the default.
    fs::path resolved_runtime_dir = defaults.runtime_dir;
    {
      carrierctrl::ConfigSources probe(ordered_config_dirs,
                                       cli_params.profiles);
      auto app_r = probe.json_content("application");
      if (app_r.is_ok() && app_r.value().is_object()) {
        if (auto *rd = app_r.value().as_object().if_contains("runtime_dir");
            rd && rd->is_string() && !rd->as_string().empty()) {
          resolved_runtime_dir = fs::path(std::string(rd->as_string()));
        }
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

    static carrierctrl::ConfigSources config_sources(cli_params.config_dirs,
                                                     cli_params.profiles);
    {
      auto logging_config_r = config_sources.logging_config();
      if (logging_config_r.is_err()) {
        std::cerr << "Failed to load log_config: " << logging_config_r.error()
                  << std::endl;
        return EXIT_FAILURE;
      }
      auto logging_config = logging_config_r.value();
      if (cli_params.silent) {
        logging_config.console = false;
      }
      DEBUG_PRINT("log dir: " << logging_config.log_dir);
      init_my_log(logging_config);
    }

    static carrierctrl::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                       std::move(unrecognized),
                                       std::move(cli_params));

    if (!cli_ctx.is_specified_by_user("verbose")) {
      auto app_r = config_sources.json_content("application");
      if (app_r.is_ok()) {
        auto config = js::value_to<carrierctrl::CarrierctrlConfig>(app_r.value());
        if (!config.verbose.empty()) {
          cli_ctx.params.verbose = config.verbose;
        }
      }
    }

    return carrierctrl::launch(config_sources, cli_ctx);
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) {
  return RunCarrierCtrlApplication(argc, argv);
}
