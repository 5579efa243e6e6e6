#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

#include "internal/storage/api/store.hpp"
#include "internal/storage/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#if BERTH_DB_SQLITE
#include "internal/storage/sqlite/sqlite_db.hpp"
#include "internal/storage/sqlite/sqlite_store.hpp"
#endif

namespace {

using berth::storage::ErrorCode;
using berth::storage::Store;
using berth::storage::model::ArtifactRecord;
using berth::storage::model::ContainerRecord;
using berth::storage::model::ContainerState;
using berth::storage::model::ImageRecord;
using berth::storage::model::NetworkRecord;

ContainerRecord MakeContainer(const std::string& id, const std::string& name) {
  ContainerRecord c;
  c.id                  = id;
  c.name                = name;
  c.image_name          = "docker.io/library/alpine:latest";
  c.image_id            = "img1";
  c.state               = ContainerState::kRunning;
  c.healthcheck_command = "true";
  c.health_status       = "healthy";
  c.labels              = {{"io.containers.autoupdate", "registry"}, {"tier", "web"}};
  c.created_at_ms       = 1000;
  return c;
}

void TestContainersRoundTripAndKeepInsertionOrder(Store& store) {
  {
    auto tx = store.Begin();
    assert(store.InsertContainer(*tx, MakeContainer("c2", "zeta")));
    assert(store.InsertContainer(*tx, MakeContainer("c1", "alpha")));
    tx->Commit();
  }

  auto tx = store.Begin();
  auto by_name = store.GetContainer(*tx, "alpha");
  assert(by_name.has_value());
  assert(by_name->id == "c1");
  assert(by_name->state == ContainerState::kRunning);
  assert(by_name->labels.at("tier") == "web");
  assert(by_name->healthcheck_command == "true");

  auto by_id = store.GetContainer(*tx, "c2");
  assert(by_id.has_value() && by_id->name == "zeta");

  // Prefix resolution is not the store's job.
  assert(!store.GetContainer(*tx, "c").has_value());

  const auto all = store.ListContainers(*tx);
  assert(all.size() == 2);
  assert(all[0].id == "c2");
  assert(all[1].id == "c1");

  const auto dup = store.InsertContainer(*tx, MakeContainer("c3", "alpha"));
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void TestContainerUpdateAndDelete(Store& store) {
  {
    auto tx      = store.Begin();
    auto updated = *store.GetContainer(*tx, "c1");
    updated.state         = ContainerState::kStopped;
    updated.health_status = "unhealthy";
    updated.labels.erase("tier");
    assert(store.UpdateContainer(*tx, updated));
    tx->Commit();
  }
  {
    auto tx = store.Begin();
    auto c  = store.GetContainer(*tx, "c1");
    assert(c->state == ContainerState::kStopped);
    assert(c->health_status == "unhealthy");
    assert(!c->labels.contains("tier"));

    const auto missing = store.UpdateContainer(*tx, MakeContainer("nope", "nope"));
    assert(missing.code == ErrorCode::NotFound);

    assert(store.DeleteContainer(*tx, "c2"));
    tx->Commit();
  }
  auto tx = store.Begin();
  assert(store.ListContainers(*tx).size() == 1);
  tx->Commit();
}

void TestImagesResolveByAnyName(Store& store) {
  ImageRecord image;
  image.id         = "0123abcd";
  image.names      = {"docker.io/library/alpine:latest", "quay.io/acme/alpine:3"};
  image.digest     = "sha256:0123abcd";
  image.size_bytes = 4096;
  image.labels     = {{"maintainer", "acme"}};

  {
    auto tx = store.Begin();
    assert(store.InsertImage(*tx, image));
    tx->Commit();
  }

  auto tx = store.Begin();
  auto found = store.GetImage(*tx, "quay.io/acme/alpine:3");
  assert(found.has_value());
  assert(found->id == "0123abcd");
  assert(found->names.size() == 2);
  assert(found->names[0] == "docker.io/library/alpine:latest");
  assert(found->size_bytes == 4096);
  assert(found->labels.at("maintainer") == "acme");

  found->names = {"quay.io/acme/alpine:3"};
  assert(store.UpdateImage(*tx, *found));
  assert(!store.GetImage(*tx, "docker.io/library/alpine:latest").has_value());
  assert(store.GetImage(*tx, "0123abcd").has_value());
  tx->Commit();
}

void TestNetworksAndArtifacts(Store& store) {
  NetworkRecord network;
  network.name        = "podnet";
  network.id          = "net-1";
  network.driver      = "bridge";
  network.dns_servers = {"10.0.0.1", "10.0.0.2"};

  {
    auto tx = store.Begin();
    assert(store.InsertNetwork(*tx, network));
    assert(store.UpsertArtifact(*tx, ArtifactRecord{"quay.io/acme/model:v1", "sha256:aa", 1}));
    assert(store.UpsertArtifact(*tx, ArtifactRecord{"quay.io/acme/model:v1", "sha256:bb", 2}));
    tx->Commit();
  }

  auto tx = store.Begin();
  auto by_id = store.GetNetwork(*tx, "net-1");
  assert(by_id.has_value());
  assert(by_id->dns_servers.size() == 2);
  assert(by_id->dns_servers[1] == "10.0.0.2");

  by_id->dns_servers = {"10.0.0.9"};
  assert(store.UpdateNetwork(*tx, *by_id));
  assert(store.GetNetwork(*tx, "podnet")->dns_servers == std::vector<std::string>{"10.0.0.9"});

  auto artifact = store.GetArtifact(*tx, "quay.io/acme/model:v1");
  assert(artifact.has_value());
  assert(artifact->digest == "sha256:bb");
  tx->Commit();
}

void TestRolledBackWritesAreInvisible(Store& store) {
  {
    auto tx = store.Begin();
    assert(store.InsertContainer(*tx, MakeContainer("ghost", "ghost")));
    assert(store.GetContainer(*tx, "ghost").has_value());
    tx->Rollback();
  }
  {
    // Dropped without commit.
    auto tx = store.Begin();
    assert(store.InsertContainer(*tx, MakeContainer("ghost2", "ghost2")));
  }
  auto tx = store.Begin();
  assert(!store.GetContainer(*tx, "ghost").has_value());
  assert(!store.GetContainer(*tx, "ghost2").has_value());
  tx->Commit();
}

void RunSuite(Store& store) {
  TestContainersRoundTripAndKeepInsertionOrder(store);
  TestContainerUpdateAndDelete(store);
  TestImagesResolveByAnyName(store);
  TestNetworksAndArtifacts(store);
  TestRolledBackWritesAreInvisible(store);
}

// Two writers on different networks, each pausing between read and write.
void TestConcurrentWritersAreSerialised(Store& store) {
  {
    auto tx = store.Begin();
    assert(store.InsertNetwork(*tx, NetworkRecord{"net-a", "id-a", "bridge", {}}));
    assert(store.InsertNetwork(*tx, NetworkRecord{"net-b", "id-b", "bridge", {}}));
    tx->Commit();
  }

  constexpr int    kRounds = 50;
  std::atomic<int> failures{0};

  auto writer = [&](const std::string& name) {
    for (int i = 0; i < kRounds; ++i) {
      try {
        auto tx      = store.Begin();
        auto network = store.GetNetwork(*tx, name);
        std::this_thread::yield();
        network->dns_servers.push_back("10.0.0." + std::to_string(i));
        if (!store.UpdateNetwork(*tx, *network)) {
          failures.fetch_add(1);
          continue;
        }
        tx->Commit();
      } catch (const std::exception&) {
        failures.fetch_add(1);
      }
    }
  };

  std::thread a(writer, "net-a");
  std::thread b(writer, "net-b");
  a.join();
  b.join();

  assert(failures.load() == 0);
  auto tx = store.Begin();
  assert(store.GetNetwork(*tx, "net-a")->dns_servers.size() == kRounds);
  assert(store.GetNetwork(*tx, "net-b")->dns_servers.size() == kRounds);
  tx->Commit();
}

void TestOpenTransactionHoldsOffTheNext() {
  berth::storage::memory::MemoryStore store;
  {
    auto tx = store.Begin();
    assert(store.InsertContainer(*tx, MakeContainer("a", "a")));
    tx->Commit();
  }

  std::atomic<bool> second_began{false};
  std::thread       other;
  {
    auto tx = store.Begin();
    assert(store.ListContainers(*tx).size() == 1);

    other = std::thread([&] {
      auto next = store.Begin();
      second_began.store(true);
      assert(store.InsertContainer(*next, MakeContainer("b", "b")));
      next->Commit();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    // The open transaction keeps the second one waiting.
    assert(!second_began.load());
    tx->Commit();
  }
  other.join();

  auto tx = store.Begin();
  assert(store.ListContainers(*tx).size() == 2);
  tx->Commit();
}

} // namespace

int main() {
  {
    berth::storage::memory::MemoryStore store;
    RunSuite(store);
    TestConcurrentWritersAreSerialised(store);
  }
  TestOpenTransactionHoldsOffTheNext();

#if BERTH_DB_SQLITE
  {
    const auto path = std::filesystem::temp_directory_path() / ("berth_store_parity_" + std::to_string(::getpid()) + ".db");
    std::filesystem::remove(path);
    {
      auto db = std::make_shared<berth::storage::sqlite::SqliteDB>(path.string());
      berth::storage::sqlite::SqliteStore store(db);
      RunSuite(store);
      TestConcurrentWritersAreSerialised(store);
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
  }
#endif

  std::cout << "berth_unit_store_parity: pass\n";
  return 0;
}
