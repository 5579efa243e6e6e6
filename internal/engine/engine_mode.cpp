#include "engine_mode.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace berth::engine {

const char* EngineModeName(EngineMode mode) {
  return mode == EngineMode::kRemote ? "remote" : "direct";
}

EngineMode ResolveEngineMode(berth::config::EngineMode configured) {
  switch (configured) {
    case berth::config::ENGINE_MODE_DIRECT:
      return EngineMode::kDirect;
    case berth::config::ENGINE_MODE_REMOTE:
      return EngineMode::kRemote;
    default:
      break;
  }

  std::string value;
  if (berth::config::EngineMode_IsValid(configured)) {
    value = berth::config::EngineMode_Name(configured);
  } else {
    value = std::to_string(static_cast<int>(configured));
  }
  throw util::Unsupported("runtime mode '" + value + "' is not supported");
}

} // namespace berth::engine
