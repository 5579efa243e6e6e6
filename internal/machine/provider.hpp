#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "berth/machine/v1/machine.pb.h"
#include "internal/machine/vm_stubber.hpp"

namespace berth::machine {

/*
  Stubber for a provider name: "qemu" on Linux, "applehv" on macOS.
  libkrun, hyperv and wsl are recognised but util::Unsupported. An empty
  name selects the platform default.
*/
std::unique_ptr<VmStubber> LookupStubber(const std::string& provider);

/*
  Reads <config_dir>/<name>.json. A missing file is util::NotFound, a
  malformed one util::Internal.
*/
berth::machine::v1::MachineConfig LoadMachineConfig(const std::filesystem::path& config_dir, const std::string& name);

} // namespace berth::machine
