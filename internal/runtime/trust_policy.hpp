#pragma once

#include <filesystem>
#include <string>

#include "berth/engine/v1/types.pb.h"

namespace berth::runtime {

/*
  Image trust policy in containers policy.json format:

    {
      "default": [{"type": "insecureAcceptAnything"}],
      "transports": {
        "docker": {"quay.io/acme": [{"type": "signedBy", "keyType": "GPGKeys", "keyPath": "/k.gpg"}]}
      }
    }

  Signature stores come from registries.d YAML files:

    default-docker: {lookaside: https://sigs.example.com}
    docker:
      quay.io/acme: {lookaside: https://acme.example.com/sigs}
*/

// Missing policy file is util::NotFound. A missing registries dir is ignored.
engine::v1::ShowTrustReport ShowTrustPolicy(const std::filesystem::path& policy_path, const std::filesystem::path& registries_dir,
                                            bool raw);

/*
  Sets the requirement for `scope` ("default" or a docker repository).
  Types: accept, reject, signedBy, sigstoreSigned. The file is created
  when absent and replaced atomically.
*/
void SetTrustPolicy(const std::filesystem::path& policy_path, const std::string& scope, const engine::v1::SetTrustOptions& options);

} // namespace berth::runtime
