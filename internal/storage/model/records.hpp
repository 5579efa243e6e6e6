#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace berth::storage::model {

enum class ContainerState : int {
  kCreated = 0,
  kRunning = 1,
  kPaused  = 2,
  kStopped = 3,
  kExited  = 4,
};

/*
  Container row as the runtime sees it.

  healthcheck_command empty means no health check is defined for the
  container. health_status holds the last probe outcome
  ("healthy", "unhealthy", "starting").
*/
struct ContainerRecord {
  std::string    id;
  std::string    name;
  std::string    image_name;
  std::string    image_id;
  ContainerState state = ContainerState::kCreated;

  std::string healthcheck_command;
  std::string health_status;

  std::map<std::string, std::string> labels;

  uint64_t created_at_ms = 0;
};

struct ImageRecord {
  std::string              id;
  std::vector<std::string> names; // fully qualified, e.g. docker.io/library/alpine:latest
  std::string              digest;
  uint64_t                 size_bytes    = 0;
  uint64_t                 created_at_ms = 0;

  std::map<std::string, std::string> labels;
};

struct NetworkRecord {
  std::string              name;
  std::string              id;
  std::string              driver;
  std::vector<std::string> dns_servers;
};

struct ArtifactRecord {
  std::string name;
  std::string digest;
  uint64_t    pulled_at_ms = 0;
};

const char* ContainerStateName(ContainerState state);

} // namespace berth::storage::model
