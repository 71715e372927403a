#include "conf/config_sources.hpp"

#include <fstream>
#include <optional>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "my_error_codes.hpp"

namespace carrierctrl {

void merge_json_objects(json::object &into, const json::object &from) {
  for (const auto &[key, value] : from) {
    auto *existing = into.if_contains(key);
    if (existing && existing->is_object() && value.is_object()) {
      merge_json_objects(existing->as_object(), value.as_object());
    } else {
      into[key] = value;
    }
  }
}

ConfigSources::ConfigSources(std::vector<fs::path> paths,
                             std::vector<std::string> profiles)
    : paths_(std::move(paths)), profiles_(std::move(profiles)) {
  if (paths_.empty()) {
    throw std::invalid_argument("ConfigSources needs at least one directory");
  }
}

Result<json::value> ConfigSources::json_content(const std::string &name) const {
  using R = Result<json::value>;
  json::object merged;
  bool found = false;

  auto apply_file = [&](const fs::path &file) -> std::optional<Error> {
    if (!fs::exists(file)) {
      return std::nullopt;
    }
    std::ifstream ifs(file);
    if (!ifs) {
      return make_error(my_errors::GENERAL::FILE_READ_WRITE,
                        "Unable to open configuration file: " + file.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        std::istreambuf_iterator<char>());
    boost::system::error_code ec;
    auto jv = json::parse(content, ec);
    if (ec) {
      return make_error(my_errors::GENERAL::JSON_PARSE_ERROR,
                        "Failed to parse " + file.string() + ": " +
                            ec.message());
    }
    if (!jv.is_object()) {
      return make_error(my_errors::GENERAL::JSON_PARSE_ERROR,
                        "Configuration file is not a JSON object: " +
                            file.string());
    }
    merge_json_objects(merged, jv.as_object());
    found = true;
    return std::nullopt;
  };

  for (const auto &dir : paths_) {
    std::vector<fs::path> files{dir / (name + ".json")};
    for (const auto &profile : profiles_) {
      files.push_back(dir / (name + "." + profile + ".json"));
    }
    files.push_back(dir / (name + ".override.json"));
    for (const auto &file : files) {
      if (auto err = apply_file(file)) {
        return R::Err(std::move(*err));
      }
    }
  }

  if (!found) {
    return R::Err(make_error(my_errors::GENERAL::FILE_NOT_FOUND,
                             "No " + name + ".json in any config directory."));
  }
  return R::Ok(json::value(std::move(merged)));
}

Result<LoggingConfig> ConfigSources::logging_config() const {
  using R = Result<LoggingConfig>;
  auto jv_r = json_content("log_config");
  if (jv_r.is_err()) {
    return R::Err(jv_r.error());
  }
  try {
    return R::Ok(json::value_to<LoggingConfig>(jv_r.value()));
  } catch (const std::exception &e) {
    return R::Err(make_error(my_errors::GENERAL::JSON_PARSE_ERROR, e.what()));
  }
}

} // namespace carrierctrl
