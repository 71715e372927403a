#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

#include "conf/config_sources.hpp"
#include "install/installation_checker.hpp"
#include "install/installation_trigger.hpp"
#include "logstream/pattern_filter.hpp"
#include "my_error_codes.hpp"
#include "util/result.hpp"

namespace carrierctrl {

namespace fs = std::filesystem;

struct InstallCheckConfig {
  std::string pattern{"SIM is ready"};
  std::string syntax{"substring"};
  std::string scope{"all"};
  bool case_sensitive{false};
  std::int64_t timeout_seconds{40};

  friend InstallCheckConfig
  tag_invoke(const json::value_to_tag<InstallCheckConfig> &,
             const json::value &jv) {
    const auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("install_check is not an object");
    }
    InstallCheckConfig ic{};
    if (auto *p = jo_p->if_contains("pattern"))
      ic.pattern = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("syntax"))
      ic.syntax = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("scope"))
      ic.scope = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("case_sensitive"))
      ic.case_sensitive = p->as_bool();
    if (auto *p = jo_p->if_contains("timeout_seconds"))
      ic.timeout_seconds = p->to_number<std::int64_t>();
    if (ic.timeout_seconds <= 0) {
      throw std::runtime_error("install_check.timeout_seconds must be > 0");
    }
    if (!logstream::parse_syntax(ic.syntax)) {
      throw std::runtime_error("install_check.syntax must be substring or "
                               "regex, got " + ic.syntax);
    }
    if (!logstream::parse_scope(ic.scope)) {
      throw std::runtime_error("install_check.scope is not a known scope: " +
                               ic.scope);
    }
    return ic;
  }

  install::InstallCheckSettings to_settings() const {
    install::InstallCheckSettings settings;
    settings.filter.pattern = pattern;
    settings.filter.mode = logstream::FilterMode::OneShot;
    settings.filter.syntax =
        logstream::parse_syntax(syntax).value_or(logstream::MatchSyntax::Substring);
    settings.filter.scope =
        logstream::parse_scope(scope).value_or(logstream::FilterScope::All);
    settings.filter.case_sensitive = case_sensitive;
    settings.timeout = std::chrono::seconds(timeout_seconds);
    return settings;
  }
};

struct InstallerConfig {
  std::string completion_field{"Status"};
  std::string completion_value{"Completed"};
  std::string package_type{"CarrierBundle"};
  std::string staging_dir{"PublicStaging"};
  std::int64_t completion_timeout_seconds{600};

  friend InstallerConfig tag_invoke(const json::value_to_tag<InstallerConfig> &,
                                    const json::value &jv) {
    const auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("installer is not an object");
    }
    InstallerConfig ic{};
    if (auto *p = jo_p->if_contains("completion_field"))
      ic.completion_field = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("completion_value"))
      ic.completion_value = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("package_type"))
      ic.package_type = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("staging_dir"))
      ic.staging_dir = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("completion_timeout_seconds"))
      ic.completion_timeout_seconds = p->to_number<std::int64_t>();
    return ic;
  }

  install::InstallerSettings to_settings() const {
    install::InstallerSettings settings;
    settings.completion_field = completion_field;
    settings.completion_value = completion_value;
    settings.options.package_type = package_type;
    settings.options.staging_dir = staging_dir;
    settings.options.completion_timeout =
        std::chrono::seconds(completion_timeout_seconds);
    return settings;
  }
};

struct CarrierctrlConfig {
  std::string verbose{};
  std::size_t worker_threads{2};
  std::size_t io_threads{1};
  fs::path runtime_dir{};
  InstallCheckConfig install_check{};
  InstallerConfig installer{};

  friend CarrierctrlConfig
  tag_invoke(const json::value_to_tag<CarrierctrlConfig> &,
             const json::value &jv) {
    const auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("CarrierctrlConfig is not an object");
    }
    try {
      CarrierctrlConfig cc{};
      if (auto *p = jo_p->if_contains("verbose"))
        cc.verbose = p->as_string().c_str();
      else
        std::cerr << "verbose not found, using default empty string"
                  << std::endl;
      if (auto *p = jo_p->if_contains("worker_threads"))
        cc.worker_threads = p->to_number<std::size_t>();
      if (auto *p = jo_p->if_contains("io_threads"))
        cc.io_threads = p->to_number<std::size_t>();
      if (cc.worker_threads == 0) {
        throw std::runtime_error("worker_threads must be > 0");
      }
      if (cc.io_threads == 0) {
        throw std::runtime_error("io_threads must be > 0");
      }
      if (auto *p = jo_p->if_contains("runtime_dir"))
        cc.runtime_dir = fs::path(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("install_check"))
        cc.install_check = json::value_to<InstallCheckConfig>(*p);
      if (auto *p = jo_p->if_contains("installer"))
        cc.installer = json::value_to<InstallerConfig>(*p);
      return cc;
    } catch (const std::exception &e) {
      throw std::runtime_error(
          std::string("error in parsing CarrierctrlConfig: ") + e.what());
    }
  }
};

class ICarrierctrlConfigProvider {
public:
  virtual ~ICarrierctrlConfigProvider() = default;

  virtual const CarrierctrlConfig &get() const = 0;
  virtual CarrierctrlConfig &get() = 0;

  // Merges `content` into the writable override file.
  virtual std::optional<Error> save(const json::object &content) = 0;
};

class CarrierctrlConfigProviderFile : public ICarrierctrlConfigProvider {
  CarrierctrlConfig config_;
  ConfigSources &config_sources_;

public:
  explicit CarrierctrlConfigProviderFile(ConfigSources &config_sources)
      : config_sources_(config_sources) {
    auto jv_r = config_sources_.json_content("application");
    if (jv_r.is_err()) {
      throw std::runtime_error("Failed to load App config: " +
                               jv_r.error().what);
    }
    config_ = json::value_to<CarrierctrlConfig>(jv_r.value());
  }

  const CarrierctrlConfig &get() const override { return config_; }
  CarrierctrlConfig &get() override { return config_; }

  std::optional<Error> save(const json::object &content) override {
    auto f = config_sources_.writable_dir() / "application.override.json";
    json::object merged;
    if (fs::exists(f)) {
      std::ifstream ifs(f);
      if (!ifs) {
        return make_error(my_errors::GENERAL::FILE_READ_WRITE,
                          "Unable to open configuration file: " + f.string());
      }
      std::string existing((std::istreambuf_iterator<char>(ifs)),
                           std::istreambuf_iterator<char>());
      boost::system::error_code ec;
      auto jv = json::parse(existing, ec);
      if (ec || !jv.is_object()) {
        return make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          "Configuration file is not a JSON object: " +
                              f.string());
      }
      merged = std::move(jv.as_object());
    }
    merge_json_objects(merged, content);

    std::ofstream ofs(f);
    if (!ofs) {
      return make_error(my_errors::GENERAL::FILE_READ_WRITE,
                        "Unable to open configuration file for writing: " +
                            f.string());
    }
    ofs << json::serialize(merged) << std::endl;
    return std::nullopt;
  }
};

} // namespace carrierctrl
