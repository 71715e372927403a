#pragma once

#include <boost/program_options.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common_macros.hpp"
#include "my_error_codes.hpp"
#include "util/result.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace carrierctrl {

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::vector<std::string> profiles;
  fs::path runtime_dir;
  std::string subcmd;
  std::string verbose; // vvvv
  bool silent = false;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  std::vector<std::string> unrecognized;
  CliParams params;
  CliCtx(po::variables_map &&vm,                  //
         std::vector<std::string> &&positionals,  //
         std::vector<std::string> &&unrecognized, //
         CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}

  // True iff the option was given explicitly rather than defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }
  ~CliCtx() { DEBUG_PRINT("CliCtx destroyed"); }

  // Positional after the subcommand, e.g. the bundle path of `install`.
  std::optional<std::string> positional_at(size_t index) const {
    if (index >= positionals.size()) {
      return std::nullopt;
    }
    return positionals[index];
  }

  Result<std::pair<std::string, std::string>> get_set_kv() const {
    using R = Result<std::pair<std::string, std::string>>;
    auto it = std::find(positionals.begin(), positionals.end(), "set");
    // cmd conf set install_check.timeout_seconds 60
    if (it == positionals.end() || std::distance(it, positionals.end()) < 3) {
      return R::Err(make_error(
          my_errors::GENERAL::SHOW_OPT_DESC,
          "Both key and value must be provided for set operation."));
    }
    return R::Ok({*(it + 1), *(it + 2)});
  }

  Result<std::string> get_get_k() const {
    auto it = std::find(positionals.begin(), positionals.end(), "get");
    // cmd conf get verbose
    if (it == positionals.end() || std::distance(it, positionals.end()) < 2) {
      return Result<std::string>::Err(
          make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                     "Key must be provided for get operation."));
    }
    return Result<std::string>::Ok(*(it + 1));
  }

  size_t positional_count() const { return positionals.size(); }
};

inline std::string_view
get_unrecognized(const std::vector<std::string> &unrecognized,
                 const std::string &option_name) {
  auto it = std::find(unrecognized.begin(), unrecognized.end(), option_name);
  if (it != unrecognized.end() && ++it != unrecognized.end()) {
    return *it;
  }
  return "";
}

inline bool parse_bool(const std::string &value) {
  std::string val_lower = value;
  std::transform(val_lower.begin(), val_lower.end(), val_lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return (val_lower == "1" || val_lower == "true" || val_lower == "yes" ||
          val_lower == "on");
}

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 4> kKnown{"monitor", "install",
                                                          "check", "conf"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

// Moves the first known subcommand to the front of the positionals so that
// `carrierctrl bundle.ipcc install` and `carrierctrl install bundle.ipcc`
// behave the same.
inline void normalize_cli_subcommand(std::string &subcmd,
                                     std::vector<std::string> &positionals) {
  if (!subcmd.empty() && is_known_subcommand(subcmd)) {
    return;
  }
  auto it = std::find_if(positionals.begin(), positionals.end(),
                         [](const std::string &p) {
                           return is_known_subcommand(p);
                         });
  if (it == positionals.end()) {
    return;
  }
  subcmd = *it;
  positionals.erase(it);
  positionals.insert(positionals.begin(), subcmd);
}

} // namespace carrierctrl
