#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include "conf/logging_config.hpp"
#include "util/result.hpp"

namespace carrierctrl {

namespace fs = std::filesystem;

// Recursively copies `from` into `into`; nested objects merge, anything else
// replaces the existing value.
void merge_json_objects(json::object &into, const json::object &from);

/**
 * Ordered list of configuration directories.
 *
 * json_content("application") walks every directory in order and merges
 * application.json, application.<profile>.json for each profile, then
 * application.override.json. Later files win key by key. The last directory
 * is the writable one, `conf set` persists its overrides there.
 */
class ConfigSources {
public:
  ConfigSources(std::vector<fs::path> paths, std::vector<std::string> profiles);

  // Errors: GENERAL::FILE_NOT_FOUND when no file with that name exists in any
  // directory, GENERAL::JSON_PARSE_ERROR for malformed or non-object files.
  Result<json::value> json_content(const std::string &name) const;

  Result<LoggingConfig> logging_config() const;

  const fs::path &writable_dir() const { return paths_.back(); }

  std::vector<fs::path> paths_;
  std::vector<std::string> profiles_;
};

} // namespace carrierctrl
