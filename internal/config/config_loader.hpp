#pragma once

#include <string>

#include "config/config.pb.h"

namespace miner::config {

/*
  Loads RuntimeConfig.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Load() layers, in order: built-in defaults for every unset
  field, the YAML file (optional), then environment overrides.
*/
class ConfigLoader {
 public:
  static miner::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // path may be empty: defaults + environment only
  static miner::runtime::config::RuntimeConfig Load(const std::string& path);

  static void ApplyDefaults(miner::runtime::config::RuntimeConfig& config);

  // MINER_DB_URL / DATABASE_URL, MINER_LOG_LEVEL, MINER_LOG_PATTERN,
  // MINER_OUTPUT_ROOT
  static void ApplyEnvironment(miner::runtime::config::RuntimeConfig& config);

  // postgres://... -> postgres backend (query string stripped)
  // sqlite://path or a plain path -> sqlite backend
  static void ApplyDatabaseUrl(miner::runtime::config::RuntimeConfig& config, const std::string& url);
};

} // namespace miner::config
