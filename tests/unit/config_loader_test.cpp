#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "berth_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDirectConfigWithSqliteStorage() {
  const auto yaml_path = WriteYaml("direct_sqlite",
                                   R"(mode: ENGINE_MODE_DIRECT
direct:
  storage:
    sqlite:
      path: "/var/lib/berth/\"quoted\"\\store.db"
  registry_mirror: /srv/mirror
  event_journal_size: 128
server:
  bind_address: "unix:///run/berth/berth.sock"
logging:
  level: debug
)");

  auto config = berth::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.mode() == berth::config::ENGINE_MODE_DIRECT);
  assert(config.direct().storage().has_sqlite());
  assert(config.direct().storage().sqlite().path() == "/var/lib/berth/\"quoted\"\\store.db");
  assert(config.direct().registry_mirror() == "/srv/mirror");
  assert(config.direct().event_journal_size() == 128);
  assert(config.server().bind_address() == "unix:///run/berth/berth.sock");
  assert(config.logging().level() == "debug");
}

void TestRemoteConfigWithMachine() {
  const auto yaml_path = WriteYaml("remote_machine",
                                   R"(mode: ENGINE_MODE_REMOTE
remote:
  machine: true
  identity: /home/dev/.ssh/id_ed25519
  connect_timeout_ms: 750
machine:
  name: dev
  provider: qemu
)");

  auto config = berth::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.mode() == berth::config::ENGINE_MODE_REMOTE);
  assert(config.remote().machine());
  assert(config.remote().connect_timeout_ms() == 750);
  assert(config.machine().name() == "dev");
  assert(config.machine().provider() == "qemu");
}

void TestEnvironmentOverridesFile() {
  const auto yaml_path = WriteYaml("env_override",
                                   R"(mode: ENGINE_MODE_DIRECT
remote:
  uri: "tcp://127.0.0.1:1"
)");

  setenv("BERTH_REMOTE", "1", 1);
  setenv("BERTH_HOST", "unix:///run/other.sock", 1);
  auto config = berth::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  unsetenv("BERTH_REMOTE");
  unsetenv("BERTH_HOST");

  assert(config.mode() == berth::config::ENGINE_MODE_REMOTE);
  assert(config.remote().uri() == "unix:///run/other.sock");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(mode: ENGINE_MODE_DIRECT
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)berth::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

} // namespace

int main() {
  TestDirectConfigWithSqliteStorage();
  TestRemoteConfigWithMachine();
  TestEnvironmentOverridesFile();
  TestUnknownFieldsAreRejected();

  std::cout << "berth_unit_config_loader: pass\n";
  return 0;
}
