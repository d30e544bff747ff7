#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/pipeline/pipeline_definition.hpp"

namespace docflow::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Durations use the protobuf JSON form ("1.5s", "300s").
*/
class ConfigLoader {
 public:
  static docflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static docflow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

/*
  Pipeline described by `pipeline.stages`, or the default four-stage
  pipeline when the section is empty. Unset per-stage fields take the
  StageSpec defaults; invalid values throw util::InvalidArgument.
*/
pipeline::PipelineDefinition PipelineFromConfig(const docflow::runtime::config::RuntimeConfig& config);

} // namespace docflow::config
