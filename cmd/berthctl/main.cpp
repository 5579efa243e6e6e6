#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/engine/event_subscription.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"

using namespace berth::engine::v1;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void Usage() {
  std::cout << "Usage:\n"
            << "  berthctl [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  healthcheck <container>\n"
            << "  events [--stream] [--since T] [--until T] [--filter key=value]...\n"
            << "  info\n"
            << "  network-update <network> [--add-dns IP]... [--remove-dns IP]...\n"
            << "  image-untag <image> [tag]...\n"
            << "  image-inspect <image>...\n"
            << "  artifact-pull <reference> [--authfile F] [--username U] [--password P] [--retry N]\n"
            << "  auto-update [--dry-run] [--rollback] [--authfile F]\n"
            << "  trust-show [--raw] [--policy-path F]\n"
            << "  trust-set <scope> --type T [--pubkeys F]... [--policy-path F]\n"
            << "  version\n";
}

void PrintJson(const google::protobuf::Message& message) {
  std::string out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    std::cerr << "failed to encode response\n";
    return;
  }
  std::cout << out;
}

// Splits "--flag value" pairs and bare flags from positionals.
struct Args {
  std::vector<std::string> positional;
  std::multimap<std::string, std::string> values;
  std::vector<std::string> flags;

  bool Has(const std::string& flag) const {
    for (const auto& f : flags) {
      if (f == flag) return true;
    }
    return values.count(flag) > 0;
  }

  std::optional<std::string> Value(const std::string& flag) const {
    auto it = values.find(flag);
    if (it == values.end()) return std::nullopt;
    return it->second;
  }

  std::vector<std::string> All(const std::string& flag) const {
    std::vector<std::string> out;
    auto [begin, end] = values.equal_range(flag);
    for (auto it = begin; it != end; ++it) out.push_back(it->second);
    return out;
  }
};

Args ParseArgs(int argc, char** argv, int start, const std::vector<std::string>& bare_flags) {
  Args args;
  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      args.positional.push_back(arg);
      continue;
    }
    bool bare = false;
    for (const auto& flag : bare_flags) {
      if (flag == arg) bare = true;
    }
    if (bare || i + 1 >= argc) {
      args.flags.push_back(arg);
    } else {
      args.values.emplace(arg, argv[++i]);
    }
  }
  return args;
}

int ReportErrors(const google::protobuf::RepeatedPtrField<UnitError>& errors) {
  for (const auto& error : errors) {
    std::cerr << "error: " << (error.unit().empty() ? "" : error.unit() + ": ") << error.message() << "\n";
  }
  return errors.empty() ? 0 : 2;
}

int RunEvents(berth::engine::Engine& engine, const Args& args) {
  EventsOptions options;
  options.set_stream(args.Has("--stream"));
  if (auto since = args.Value("--since")) options.set_since(*since);
  if (auto until = args.Value("--until")) options.set_until(*until);
  for (const auto& filter : args.All("--filter")) options.add_filter(filter);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  berth::engine::EventSubscription subscription(engine, options, [](const Event& event) {
    std::string line;
    if (google::protobuf::util::MessageToJsonString(event, &line).ok()) {
      std::cout << line << std::endl;
    }
  });

  while (g_running && !subscription.Done()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  subscription.Stop();
  subscription.Wait();
  return 0;
}

int Run(berth::engine::Engine& engine, const std::string& cmd, int argc, char** argv, int start) {
  if (cmd == "healthcheck") {
    auto args = ParseArgs(argc, argv, start, {});
    if (args.positional.size() != 1) return 1;
    auto results = engine.HealthCheckRun(args.positional[0], HealthCheckOptions{});
    std::cout << results.status() << "\n";
    return 0;
  }

  if (cmd == "events") {
    return RunEvents(engine, ParseArgs(argc, argv, start, {"--stream"}));
  }

  if (cmd == "info") {
    PrintJson(engine.Info());
    return 0;
  }

  if (cmd == "network-update") {
    auto args = ParseArgs(argc, argv, start, {});
    if (args.positional.size() != 1) return 1;
    NetworkUpdateOptions options;
    for (const auto& ip : args.All("--add-dns")) options.add_add_dns_servers(ip);
    for (const auto& ip : args.All("--remove-dns")) options.add_remove_dns_servers(ip);
    engine.NetworkUpdate(args.positional[0], options);
    std::cout << args.positional[0] << "\n";
    return 0;
  }

  if (cmd == "image-untag") {
    auto args = ParseArgs(argc, argv, start, {});
    if (args.positional.empty()) return 1;
    engine.ImageUntag(args.positional[0], std::vector<std::string>(args.positional.begin() + 1, args.positional.end()));
    return 0;
  }

  if (cmd == "image-inspect") {
    auto args = ParseArgs(argc, argv, start, {});
    if (args.positional.empty()) return 1;
    auto response = engine.ImageInspect(args.positional);
    for (const auto& image : response.images()) PrintJson(image);
    return ReportErrors(response.errors());
  }

  if (cmd == "artifact-pull") {
    auto args = ParseArgs(argc, argv, start, {});
    if (args.positional.size() != 1) return 1;
    ArtifactPullOptions options;
    if (auto v = args.Value("--authfile")) options.set_authfile(*v);
    if (auto v = args.Value("--username")) options.set_username(*v);
    if (auto v = args.Value("--password")) options.set_password(*v);
    if (auto v = args.Value("--retry")) options.set_retry(static_cast<uint32_t>(std::stoul(*v)));
    auto report = engine.ArtifactPull(args.positional[0], options);
    std::cout << report.artifact_digest() << "\n";
    return 0;
  }

  if (cmd == "auto-update") {
    auto args = ParseArgs(argc, argv, start, {"--dry-run", "--rollback"});
    AutoUpdateOptions options;
    if (args.Has("--dry-run")) options.set_dry_run(true);
    if (args.Has("--rollback")) options.set_rollback(true);
    if (auto v = args.Value("--authfile")) options.set_authfile(*v);
    auto response = engine.AutoUpdate(options);
    for (const auto& report : response.reports()) {
      std::cout << report.systemd_unit() << " " << report.container_name() << " " << report.image_name() << " " << report.policy()
                << " " << report.updated() << "\n";
    }
    return ReportErrors(response.errors());
  }

  if (cmd == "trust-show") {
    auto args = ParseArgs(argc, argv, start, {"--raw"});
    ShowTrustOptions options;
    options.set_raw(args.Has("--raw"));
    if (auto v = args.Value("--policy-path")) options.set_policy_path(*v);
    auto report = engine.ShowTrust(options);
    if (options.raw()) {
      std::cout << report.raw() << "\n";
    } else {
      for (const auto& entry : report.policies()) {
        std::cout << entry.repo_name() << "\t" << entry.type() << "\t" << entry.transport() << "\t" << entry.sig_store() << "\n";
      }
    }
    return 0;
  }

  if (cmd == "trust-set") {
    auto args = ParseArgs(argc, argv, start, {});
    if (args.positional.size() != 1 || !args.Value("--type")) return 1;
    SetTrustOptions options;
    options.set_type(*args.Value("--type"));
    for (const auto& f : args.All("--pubkeys")) options.add_pubkeys_file(f);
    if (auto v = args.Value("--policy-path")) options.set_policy_path(*v);
    engine.SetTrust(args.positional[0], options);
    return 0;
  }

  if (cmd == "version") {
    PrintJson(engine.Info().version());
    return 0;
  }

  Usage();
  return 1;
}

}

int main(int argc, char** argv) {
  int next = 1;
  std::string config_path;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    next = 3;
  }
  if (next >= argc) {
    Usage();
    return 1;
  }
  const std::string cmd = argv[next];

  try {
    berth::config::EngineConfig config;
    if (!config_path.empty()) {
      config = berth::config::ConfigLoader::LoadFromYaml(config_path);
    } else {
      config.set_mode(berth::config::ENGINE_MODE_DIRECT);
      berth::config::ConfigLoader::ApplyEnvironment(&config);
    }
    berth::observability::InitializeLogging(config);
    berth::observability::InitializeTelemetry(config);

    auto engine = berth::factory::NewEngine(config);
    const int rc = Run(*engine, cmd, argc, argv, next + 1);
    if (rc == 1) Usage();
    engine->Shutdown();
    berth::observability::ShutdownTelemetry();
    berth::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    berth::observability::ShutdownTelemetry();
    berth::observability::ShutdownLogging();
    return 2;
  }
}
