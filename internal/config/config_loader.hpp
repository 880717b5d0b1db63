#pragma once

#include <string>

#include "config/config.pb.h"

namespace stockcount::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so the schema lives in
  proto/config/config.proto and unknown keys are rejected. Every failure is
  reported as util::ValidationError.
*/
class ConfigLoader {
 public:
  static stockcount::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset fields with the engine defaults.
  static void ApplyDefaults(stockcount::runtime::config::RuntimeConfig& config);

  // Throws util::ValidationError on values the engine cannot run with.
  static void Validate(const stockcount::runtime::config::RuntimeConfig& config);
};

} // namespace stockcount::config
