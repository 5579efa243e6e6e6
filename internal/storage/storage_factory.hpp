#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/storage/api/store.hpp"

namespace berth::storage {

/*
  Opens the record store named by the direct backend configuration.

      auto store = storage::OpenStore(config.direct().storage());

  An empty config yields a memory store. Failing to open the configured
  backend throws; callers treat that as fatal.
*/
std::shared_ptr<Store> OpenStore(const berth::config::StorageConfig& cfg);

} // namespace berth::storage
