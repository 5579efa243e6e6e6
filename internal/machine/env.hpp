#pragma once

#include <filesystem>
#include <string>

namespace berth::machine {

// "berth-<name>", used for pipe and unit names.
std::string WithPrefix(const std::string& name);

// /run for root, the rootless runtime dir otherwise.
std::filesystem::path RuntimeDir();

// Directory holding machine images and keys.
std::filesystem::path GlobalDataDir();

std::filesystem::path SshIdentityPath(const std::string& name);

// \\.\pipe\berth-<name>
std::string PipePath(const std::string& name);

// Directory of <name>.json machine configs for a provider.
std::filesystem::path ConfigDir(const std::string& provider);

} // namespace berth::machine
