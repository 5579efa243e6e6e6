#pragma once

#include <string>

#include "config/config.pb.h"

namespace berth::config {

/*
  Loads EngineConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static berth::config::EngineConfig LoadFromYaml(const std::string& path);

  /*
    Environment overrides applied on top of the file:
      BERTH_REMOTE=1|true  forces remote mode
      BERTH_HOST           replaces remote.uri
      BERTH_IDENTITY       replaces remote.identity
  */
  static void ApplyEnvironment(berth::config::EngineConfig* config);
};

} // namespace berth::config
