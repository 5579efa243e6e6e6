#include "qemu_stubber.hpp"

#include <signal.h>
#include <sys/types.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace berth::machine {

namespace {

namespace fs = std::filesystem;

std::optional<pid_t> ReadPid(const std::string& path, std::vector<std::string>& messages) {
  if (path.empty()) {
    return std::nullopt;
  }
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  long pid = 0;
  if (!(in >> pid) || pid <= 0) {
    messages.push_back("ignoring malformed pid file " + path);
    return std::nullopt;
  }
  return static_cast<pid_t>(pid);
}

// A zombie counts as gone; the qemu parent may not have reaped it yet.
bool IsAlive(pid_t pid) {
  if (kill(pid, 0) != 0 && errno != EPERM) {
    return false;
  }
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) {
    return true;
  }
  std::string line;
  std::getline(stat, line);
  const auto close = line.rfind(')');
  return close == std::string::npos || close + 2 >= line.size() || line[close + 2] != 'Z';
}

void RemoveFile(const berth::machine::v1::VMFile& file, RemoveReport& report) {
  for (const auto& path : {file.path(), file.symlink()}) {
    if (path.empty()) continue;
    std::error_code ec;
    if (fs::remove(path, ec)) {
      report.removed.push_back(path);
    } else if (ec) {
      report.messages.push_back("unable to remove " + path + ": " + ec.message());
    }
  }
}

} // namespace

const char* VmStatusName(VmStatus status) {
  switch (status) {
    case VmStatus::kRunning:
      return "running";
    case VmStatus::kStopped:
      return "stopped";
    case VmStatus::kStarting:
      return "starting";
    case VmStatus::kUnknown:
      break;
  }
  return "unknown";
}

QemuStubber::QemuStubber(std::chrono::milliseconds stop_timeout) : stop_timeout_(stop_timeout) {
}

StateReport QemuStubber::State(const berth::machine::v1::MachineConfig& config) {
  StateReport report;

  auto pid = ReadPid(config.pid_file().path(), report.messages);
  if (!pid) {
    report.status = VmStatus::kStopped;
    return report;
  }
  if (!IsAlive(*pid)) {
    report.messages.push_back("stale pid file " + config.pid_file().path());
    report.status = VmStatus::kStopped;
    return report;
  }

  std::error_code ec;
  const auto&     socket = config.api_socket().path();
  report.status          = (!socket.empty() && !fs::exists(socket, ec)) ? VmStatus::kStarting : VmStatus::kRunning;
  return report;
}

StopReport QemuStubber::StopVM(const berth::machine::v1::MachineConfig& config, bool force) {
  StopReport report;

  auto pid = ReadPid(config.pid_file().path(), report.messages);
  if (!pid || !IsAlive(*pid)) {
    report.messages.push_back("machine " + config.name() + " is not running");
    return report;
  }

  if (kill(*pid, force ? SIGKILL : SIGTERM) != 0) {
    throw util::Internal("stop machine " + config.name() + ": " + std::strerror(errno));
  }

  const auto deadline = std::chrono::steady_clock::now() + stop_timeout_;
  while (IsAlive(*pid)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      report.messages.push_back("machine " + config.name() + " did not stop within the timeout");
      return report;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  std::error_code ec;
  fs::remove(config.pid_file().path(), ec);
  BERTH_LOG_INFO("machine stopped", {observability::StringField("machine", config.name()), observability::BoolField("force", force)});
  return report;
}

RemoveReport QemuStubber::Remove(const berth::machine::v1::MachineConfig& config) {
  RemoveReport report;

  auto pid = ReadPid(config.pid_file().path(), report.messages);
  if (pid && IsAlive(*pid)) {
    throw util::Conflict("machine " + config.name() + " is running: stop it before removing");
  }

  RemoveFile(config.pid_file(), report);
  RemoveFile(config.qmp_socket(), report);
  RemoveFile(config.api_socket(), report);
  RemoveFile(config.log_path(), report);
  return report;
}

} // namespace berth::machine
