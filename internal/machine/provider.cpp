#include "provider.hpp"

#include <google/protobuf/util/json_util.h>

#include <array>
#include <fstream>
#include <iterator>

#include "internal/machine/applehv_stubber.hpp"
#include "internal/machine/qemu_stubber.hpp"
#include "internal/util/errors.hpp"

namespace berth::machine {

namespace {

#ifdef __APPLE__
constexpr char kDefaultProvider[] = "applehv";
#else
constexpr char kDefaultProvider[] = "qemu";
#endif

constexpr std::array<const char*, 3> kForeignProviders = {"libkrun", "hyperv", "wsl"};

} // namespace

std::unique_ptr<VmStubber> LookupStubber(const std::string& provider) {
  const std::string name = provider.empty() ? kDefaultProvider : provider;

  if (name == "qemu") {
#ifdef __linux__
    return std::make_unique<QemuStubber>();
#else
    throw util::Unsupported("machine provider qemu is not supported on this platform");
#endif
  }

  if (name == "applehv") {
#ifdef __APPLE__
    return std::make_unique<AppleHvStubber>();
#else
    throw util::Unsupported("machine provider applehv is not supported on this platform");
#endif
  }

  for (const char* foreign : kForeignProviders) {
    if (name == foreign) {
      throw util::Unsupported("machine provider " + name + " is not supported on this platform");
    }
  }
  throw util::Unsupported("unknown machine provider \"" + name + "\"");
}

berth::machine::v1::MachineConfig LoadMachineConfig(const std::filesystem::path& config_dir, const std::string& name) {
  const auto    path = config_dir / (name + ".json");
  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("machine " + name + " does not exist: " + path.string());
  }
  const std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  berth::machine::v1::MachineConfig         config;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status            = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::Internal("invalid machine config " + path.string() + ": " + std::string(status.message()));
  }
  if (config.name().empty()) {
    config.set_name(name);
  }
  return config;
}

} // namespace berth::machine
