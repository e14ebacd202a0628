#include "internal/registry/store_registry.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_store_backend.hpp"
#include "internal/metadata/metadata_index.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/shop_fixture.hpp"

namespace {

using shopstore::db::memory::MemoryStoreBackend;
using shopstore::metadata::MetadataIndex;
using shopstore::registry::StoreRegistry;
using shopstore::testing::FreshDirectory;
using shopstore::util::Context;

struct Harness {
  explicit Harness(const std::string& name)
      : backend(std::make_shared<MemoryStoreBackend>()),
        index(std::make_shared<MetadataIndex>(FreshDirectory("shopstore_registry_tests", name))),
        registry(backend, index) {
  }

  std::shared_ptr<MemoryStoreBackend> backend;
  std::shared_ptr<MetadataIndex>      index;
  StoreRegistry                       registry;
};

void TestCreateRecordsAddressAndReusesHandle() {
  Harness h("create");
  auto    ctx = Context::Background();

  auto handle = h.registry.GetOrCreate(ctx, "alpha");
  assert(handle);

  auto meta = h.index->Get("alpha");
  assert(meta.has_value());
  assert(meta->storage_address() == handle->Address());

  assert(h.registry.GetOrCreate(ctx, "alpha") == handle);
  assert(h.registry.IsOpen("alpha"));
  assert(h.registry.Connected().at("alpha") == handle->Address());
  assert(h.backend->OpenCount(handle->Address()) == 1);
}

void TestConcurrentFirstOpenIsSingleFlight() {
  Harness h("single_flight");
  auto    ctx = Context::Background();

  constexpr int                                 kThreads = 16;
  std::vector<shopstore::db::DocumentStorePtr> handles(kThreads);
  std::vector<std::thread>                      threads;
  std::atomic<bool>                             go{false};

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      handles[i] = h.registry.GetOrCreate(ctx, "beta");
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  for (const auto& handle : handles) assert(handle == handles.front());
  assert(h.backend->OpenCount(handles.front()->Address()) == 1);
  assert(h.registry.OpenIds().size() == 1);
}

void TestCloseThenNotOpen() {
  Harness h("close");
  auto    ctx = Context::Background();

  auto address = h.registry.GetOrCreate(ctx, "gamma")->Address();
  h.registry.Close("gamma");
  assert(!h.registry.IsOpen("gamma"));

  bool threw = false;
  try {
    h.registry.Close("gamma");
  } catch (const shopstore::util::NotOpen&) {
    threw = true;
  }
  assert(threw);

  // reopened from the recorded address, not re-created
  auto reopened = h.registry.GetOrCreate(ctx, "gamma");
  assert(reopened->Address() == address);
  assert(h.backend->OpenCount(address) == 2);
}

void TestCorruptedStoreAndRepair() {
  Harness h("repair");
  auto    ctx = Context::Background();

  auto address = h.registry.GetOrCreate(ctx, "delta")->Address();
  h.registry.Close("delta");
  h.backend->MarkCorrupted(address);

  bool threw = false;
  try {
    (void)h.registry.GetOrCreate(ctx, "delta");
  } catch (const shopstore::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(!h.registry.IsOpen("delta"));

  auto repaired = h.registry.Repair(ctx, "delta");
  assert(repaired->Address() == address);
  assert(h.registry.IsOpen("delta"));
  assert(h.registry.GetOrCreate(ctx, "delta") == repaired);

  threw = false;
  try {
    (void)h.registry.Repair(ctx, "unknown");
  } catch (const shopstore::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestReconnectAdoptAndCloseAll() {
  Harness h("reconnect");
  auto    ctx = Context::Background();

  auto address = h.registry.GetOrCreate(ctx, "epsilon")->Address();
  h.registry.CloseAll();
  assert(h.registry.OpenIds().empty());

  auto reconnected = h.registry.Reconnect(ctx, "epsilon", address);
  assert(reconnected->Address() == address);
  assert(h.registry.Reconnect(ctx, "epsilon", address) == reconnected);

  shopstore::db::DocumentStorePtr fresh;
  auto                            created = h.backend->Create("shop-epsilon", &fresh);
  assert(created);
  h.registry.Adopt("epsilon", fresh);
  assert(h.registry.Find("epsilon") == fresh);

  // the replaced handle was closed
  shopstore::db::model::DocumentRecord doc;
  doc.key  = "epsilon";
  doc.type = "shop";
  assert(reconnected->Put(ctx, doc).code == shopstore::db::ErrorCode::Closed);

  h.registry.CloseAll();
  assert(!h.registry.IsOpen("epsilon"));
}

void TestCancelledContext() {
  Harness h("cancelled");
  auto    ctx = Context::Background();
  ctx.Cancel();

  bool threw = false;
  try {
    (void)h.registry.GetOrCreate(ctx, "zeta");
  } catch (const shopstore::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(!h.registry.IsOpen("zeta"));
  assert(!h.index->Get("zeta").has_value());
}

void TestLifecycleSlotsAreReleased() {
  Harness h("lifecycle_slots");
  auto    ctx = Context::Background();

  bool threw = false;
  try {
    h.registry.Close("never-opened");
  } catch (const shopstore::util::NotOpen&) {
    threw = true;
  }
  assert(threw);
  assert(h.registry.LifecycleSlots() == 0);

  for (int i = 0; i < 32; ++i) {
    const auto id = "eta-" + std::to_string(i);
    (void)h.registry.GetOrCreate(ctx, id);
    h.registry.Close(id);
  }
  (void)h.registry.GetOrCreate(ctx, "theta");
  (void)h.registry.Repair(ctx, "theta");
  assert(h.registry.LifecycleSlots() == 0);
}

} // namespace

int main() {
  TestCreateRecordsAddressAndReusesHandle();
  TestConcurrentFirstOpenIsSingleFlight();
  TestCloseThenNotOpen();
  TestCorruptedStoreAndRepair();
  TestReconnectAdoptAndCloseAll();
  TestCancelledContext();
  TestLifecycleSlotsAreReleased();

  std::cout << "shopstore_unit_store_registry: pass\n";
  return 0;
}
