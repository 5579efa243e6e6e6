#pragma once

#include "config/config.pb.h"

namespace berth::engine {

enum class EngineMode {
  kDirect,
  kRemote,
};

const char* EngineModeName(EngineMode mode);

/*
  Maps the configured mode onto a backend. Anything but DIRECT or REMOTE
  (including UNSPECIFIED and out-of-range values) throws
  util::Unsupported("runtime mode '<value>' is not supported").
*/
EngineMode ResolveEngineMode(berth::config::EngineMode configured);

} // namespace berth::engine
