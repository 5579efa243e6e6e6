#include "records.hpp"

namespace berth::storage::model {

const char* ContainerStateName(ContainerState state) {
  switch (state) {
    case ContainerState::kCreated:
      return "created";
    case ContainerState::kRunning:
      return "running";
    case ContainerState::kPaused:
      return "paused";
    case ContainerState::kStopped:
      return "stopped";
    case ContainerState::kExited:
      return "exited";
  }
  return "unknown";
}

} // namespace berth::storage::model
