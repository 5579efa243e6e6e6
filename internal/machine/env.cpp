#include "env.hpp"

#include <unistd.h>

#include <cstdlib>

#include "internal/util/errors.hpp"

namespace berth::machine {

namespace {

std::filesystem::path HomeDir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    throw util::Internal("cannot determine home directory: HOME is not set");
  }
  return home;
}

std::filesystem::path XdgDir(const char* variable, const char* fallback) {
  const char* value = std::getenv(variable);
  if (value != nullptr && *value != '\0') {
    return value;
  }
  return HomeDir() / fallback;
}

} // namespace

std::string WithPrefix(const std::string& name) {
  return "berth-" + name;
}

std::filesystem::path RuntimeDir() {
  if (geteuid() == 0) {
    return "/run";
  }
  const char* xdg = std::getenv("XDG_RUNTIME_DIR");
  if (xdg != nullptr && *xdg != '\0') {
    return xdg;
  }
  return std::filesystem::path("/run/user") / std::to_string(getuid());
}

std::filesystem::path GlobalDataDir() {
  return XdgDir("XDG_DATA_HOME", ".local/share") / "berth" / "machine";
}

std::filesystem::path SshIdentityPath(const std::string& name) {
  return GlobalDataDir() / name;
}

std::string PipePath(const std::string& name) {
  return R"(\\.\pipe\)" + WithPrefix(name);
}

std::filesystem::path ConfigDir(const std::string& provider) {
  return XdgDir("XDG_CONFIG_HOME", ".config") / "berth" / "machine" / provider;
}

} // namespace berth::machine
