#include "handlers/conf_handler.hpp"

#include <boost/log/sources/record_ostream.hpp>
#include <fmt/format.h>

#include <iostream>

namespace carrierctrl {

namespace trivial = boost::log::trivial;

namespace {
Error unknown_key(const std::string &key) {
  return make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                    fmt::format("Unknown configuration key: {}, supported "
                                "keys are: {}",
                                key, ConfHandler::supported_keys()));
}
} // namespace

Result<json::object> ConfHandler::apply(const std::string &key,
                                        const std::string &value) {
  using R = Result<json::object>;
  auto &cfg = config_provider_.get();
  if (key == "verbose") {
    cfg.verbose = value;
    return R::Ok({{"verbose", value}});
  }
  if (key == "install_check.pattern") {
    // Validate before persisting, a bad regex would break every later check.
    auto probe = cfg.install_check;
    probe.pattern = value;
    auto filter_r = logstream::PatternFilter::create(probe.to_settings().filter);
    if (filter_r.is_err()) {
      return R::Err(filter_r.error());
    }
    cfg.install_check.pattern = value;
    return R::Ok({{"install_check", {{"pattern", value}}}});
  }
  if (key == "install_check.scope") {
    if (!logstream::parse_scope(value)) {
      return R::Err(make_error(
          my_errors::GENERAL::INVALID_ARGUMENT,
          "Scope must be one of all, device, process, level, message."));
    }
    cfg.install_check.scope = value;
    return R::Ok({{"install_check", {{"scope", value}}}});
  }
  if (key == "install_check.case_sensitive") {
    bool b = parse_bool(value);
    cfg.install_check.case_sensitive = b;
    return R::Ok({{"install_check", {{"case_sensitive", b}}}});
  }
  if (key == "install_check.timeout_seconds") {
    std::int64_t seconds = 0;
    try {
      std::size_t consumed = 0;
      seconds = std::stoll(value, &consumed);
      if (consumed != value.size()) {
        seconds = 0;
      }
    } catch (const std::exception &) {
      seconds = 0;
    }
    if (seconds <= 0) {
      return R::Err(make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                               "Timeout must be a positive number of seconds."));
    }
    cfg.install_check.timeout_seconds = seconds;
    return R::Ok({{"install_check", {{"timeout_seconds", seconds}}}});
  }
  if (key == "installer.package_type") {
    cfg.installer.package_type = value;
    return R::Ok({{"installer", {{"package_type", value}}}});
  }
  return R::Err(unknown_key(key));
}

std::optional<std::string> ConfHandler::lookup(const std::string &key) const {
  const auto &cfg = config_provider_.get();
  if (key == "verbose") {
    return cfg.verbose;
  } else if (key == "install_check.pattern") {
    return cfg.install_check.pattern;
  } else if (key == "install_check.scope") {
    return cfg.install_check.scope;
  } else if (key == "install_check.case_sensitive") {
    return std::string(cfg.install_check.case_sensitive ? "true" : "false");
  } else if (key == "install_check.timeout_seconds") {
    return std::to_string(cfg.install_check.timeout_seconds);
  } else if (key == "installer.package_type") {
    return cfg.installer.package_type;
  }
  return std::nullopt;
}

void ConfHandler::start(Completion done) {
  if (auto setv_r = cli_ctx_.get_set_kv(); setv_r.is_ok()) {
    auto [key, value] = setv_r.value();
    auto fragment_r = apply(key, value);
    if (fragment_r.is_err()) {
      done(fragment_r.error());
      return;
    }
    if (auto err = config_provider_.save(fragment_r.value())) {
      done(std::move(err));
      return;
    }
    BOOST_LOG_SEV(lg, trivial::info) << "Configuration " << key << " set to "
                                     << value;
    output_.info() << "Set " << key << " to " << value << std::endl;
  } else if (auto getv_r = cli_ctx_.get_get_k(); getv_r.is_ok()) {
    auto key = getv_r.value();
    auto value = lookup(key);
    if (!value) {
      done(unknown_key(key));
      return;
    }
    std::cout << key << " = " << *value << std::endl;
  } else {
    done(make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
    return;
  }
  done(std::nullopt);
}

} // namespace carrierctrl
