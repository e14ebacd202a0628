#include "internal/core/shop_manager.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/shop_fixture.hpp"

namespace {

using shopstore::core::AssetType;
using shopstore::core::ListShopsOptions;
using shopstore::testing::MakeShop;
using shopstore::testing::ShopFixture;
using shopstore::testing::Throws;
using shopstore::util::Context;

namespace util = shopstore::util;

void TestCreateGetListDelete() {
  ShopFixture f("create_get_list_delete");
  auto        ctx = Context::Background();

  auto created = f.manager->CreateShop(ctx, MakeShop("alice-shop", "0xABC", "Alice's Goods"));
  assert(created.id() == "alice-shop");
  assert(created.url_name() == "alices-goods");
  assert(!created.storage_address().empty());

  auto fetched = f.manager->GetShop(ctx, "alice-shop");
  assert(fetched.name() == "Alice's Goods");
  assert(fetched.owner() == "0xABC");

  ListShopsOptions options;
  options.owner = "0xABC";
  auto listed   = f.manager->ListShops(ctx, options);
  assert(listed.size() == 1);
  assert(listed.front().id() == "alice-shop");

  f.manager->DeleteShop(ctx, "alice-shop");
  assert(Throws<util::NotFound>([&] { (void)f.manager->GetShop(ctx, "alice-shop"); }));
  assert(!f.index->Get("alice-shop").has_value());
  assert(!f.cache->Get("alice-shop").has_value());
  assert(!f.registry->IsOpen("alice-shop"));
  assert(f.manager->GetShopCount() == 0);

  assert(Throws<util::NotFound>([&] { f.manager->DeleteShop(ctx, "alice-shop"); }));
}

void TestReadsFallBackToStoreOnCacheMiss() {
  ShopFixture f("cache_miss");
  auto        ctx = Context::Background();

  f.manager->CreateShop(ctx, MakeShop("bob-shop", "0xB0B", "Bob's Bits"));
  f.cache->Clear();
  f.registry->Close("bob-shop");

  auto shop = f.manager->GetShop(ctx, "bob-shop");
  assert(shop.name() == "Bob's Bits");
  assert(f.registry->IsOpen("bob-shop"));
  assert(f.cache->Get("bob-shop").has_value());

  assert(Throws<util::NotFound>([&] { (void)f.manager->GetShop(ctx, "nobody"); }));
  assert(Throws<util::ValidationError>([&] { (void)f.manager->GetShop(ctx, "../etc"); }));
}

void TestDefaultsAndValidation() {
  ShopFixture f("defaults");
  auto        ctx = Context::Background();

  auto shop = f.manager->CreateShop(ctx, MakeShop("", "0xDEF", "  Fancy -- Shop! "));
  assert(shop.id() == "0xDEF");
  assert(shop.url_name() == "fancy-shop");

  assert(Throws<util::AlreadyExists>([&] { (void)f.manager->CreateShop(ctx, MakeShop("0xDEF", "0xDEF", "Again")); }));

  assert(Throws<util::ValidationError>([&] { (void)f.manager->CreateShop(ctx, MakeShop("no-owner", "", "Name")); }));
  assert(Throws<util::ValidationError>([&] { (void)f.manager->CreateShop(ctx, MakeShop("no-name", "0x1", "")); }));
  assert(Throws<util::ValidationError>([&] { (void)f.manager->CreateShop(ctx, MakeShop("a/b", "0x1", "Slash")); }));

  auto bad_item = MakeShop("bad-item", "0x1", "Bad Item");
  auto item     = bad_item.mutable_content()->add_items();
  item->set_name("widget");
  item->set_price(-1);
  assert(Throws<util::ValidationError>([&] { (void)f.manager->CreateShop(ctx, bad_item); }));

  item->set_price(2.5);
  item->clear_name();
  assert(Throws<util::ValidationError>([&] { (void)f.manager->CreateShop(ctx, bad_item); }));

  assert(f.manager->GetShopCount() == 1);
}

void TestUpdatePreservesCreated() {
  ShopFixture f("update");
  auto        ctx = Context::Background();

  auto created = f.manager->CreateShop(ctx, MakeShop("carol", "0xCA", "Carol's"));
  assert(created.created().seconds() == created.updated().seconds());

  f.clock.Advance(std::chrono::hours(2));

  auto changed = created;
  changed.set_description("now with more stock");
  changed.clear_created();
  auto item = changed.mutable_content()->add_items();
  item->set_name("lamp");
  item->set_price(12);

  auto updated = f.manager->UpdateShop(ctx, changed);
  assert(updated.created().seconds() == created.created().seconds());
  assert(updated.updated().seconds() == created.created().seconds() + 2 * 3600);
  assert(updated.content().items(0).created().seconds() == updated.updated().seconds());

  f.cache->Clear();
  auto stored = f.manager->GetShop(ctx, "carol");
  assert(stored.description() == "now with more stock");
  assert(stored.created().seconds() == created.created().seconds());
  assert(stored.updated().seconds() == updated.updated().seconds());

  assert(Throws<util::NotFound>([&] { (void)f.manager->UpdateShop(ctx, MakeShop("ghost", "0x0", "Ghost")); }));
}

// Readers that miss the cache while the shop is being deleted must not
// bring its metadata or store back.
void TestReadsRacingDeleteDoNotResurrect() {
  ShopFixture f("read_delete_race");
  auto        ctx = Context::Background();

  for (int round = 0; round < 50; ++round) {
    f.manager->CreateShop(ctx, MakeShop("race", "0xRA", "Race"));
    f.cache->Clear();

    std::atomic<bool>        go{false};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
      readers.emplace_back([&] {
        while (!go.load()) std::this_thread::yield();
        for (int i = 0; i < 20; ++i) {
          try {
            (void)f.manager->GetShop(ctx, "race");
          } catch (const util::NotFound&) {
          }
          f.cache->Remove("race");
        }
      });
    }

    go = true;
    f.manager->DeleteShop(ctx, "race");
    for (auto& t : readers) t.join();

    assert(!f.index->Get("race"));
    assert(!f.registry->IsOpen("race"));
    assert(f.manager->GetShopCount() == 0);
    assert(Throws<util::NotFound>([&] { (void)f.manager->GetShop(ctx, "race"); }));
  }

  assert(f.manager->ShopLockSlots() == 0);
  assert(f.registry->LifecycleSlots() == 0);
}

void TestAssets() {
  ShopFixture f("assets");
  auto        ctx = Context::Background();

  f.manager->CreateShop(ctx, MakeShop("dave", "0xDA", "Dave's"));

  auto shop = f.manager->AddShopAsset(ctx, "dave", AssetType::Logo, "bafylogo");
  assert(shop.assets().logo_cid() == "bafylogo");

  f.manager->AddShopAsset(ctx, "dave", AssetType::Item, "bafy1");
  shop = f.manager->AddShopAsset(ctx, "dave", AssetType::Item, "bafy2");
  assert(shop.assets().item_image_cids_size() == 2);

  shop = f.manager->RemoveShopAsset(ctx, "dave", AssetType::Item, "bafy1");
  assert(shop.assets().item_image_cids_size() == 1);
  assert(shop.assets().item_image_cids(0) == "bafy2");

  // a different cid leaves the logo alone
  shop = f.manager->RemoveShopAsset(ctx, "dave", AssetType::Logo, "other");
  assert(shop.assets().logo_cid() == "bafylogo");
  shop = f.manager->RemoveShopAsset(ctx, "dave", AssetType::Logo, "bafylogo");
  assert(shop.assets().logo_cid().empty());

  assert(Throws<util::ValidationError>([&] { (void)f.manager->AddShopAsset(ctx, "dave", AssetType::Item, ""); }));
  assert(Throws<util::NotFound>([&] { (void)f.manager->AddShopAsset(ctx, "nobody", AssetType::Logo, "cid"); }));

  assert(shopstore::core::ParseAssetType("logo") == AssetType::Logo);
  assert(shopstore::core::ParseAssetType("item") == AssetType::Item);
  assert(Throws<util::ValidationError>([] { (void)shopstore::core::ParseAssetType("banner"); }));
}

void TestAdministration() {
  ShopFixture f("admin");
  auto        ctx = Context::Background();

  f.manager->CreateShop(ctx, MakeShop("erin", "0xE1", "Erin's"));
  f.manager->CreateShop(ctx, MakeShop("frank", "0xF1", "Frank's"));

  auto stats = f.manager->GetDatabaseStats(ctx);
  assert(stats.total_databases == 2);
  assert(stats.loaded_databases == 2);
  assert(stats.total_records == 2);
  assert(stats.avg_records_per_store == 1);
  assert(stats.cached_shops == 2);

  auto status = f.manager->GetDatabaseStatus(ctx, "erin");
  assert(status.loaded);
  assert(status.record_count == 1);
  assert(!status.address.empty());

  assert(f.manager->ConnectedDatabases().size() == 2);

  f.manager->CloseShopDatabase("erin");
  assert(Throws<util::NotOpen>([&] { f.manager->CloseShopDatabase("erin"); }));
  assert(Throws<util::ValidationError>([&] { f.manager->CloseShopDatabase("../erin"); }));
  assert(Throws<util::ValidationError>([&] { f.manager->CloseShopDatabase(""); }));
  assert(f.manager->ShopLockSlots() == 0);
  assert(f.registry->LifecycleSlots() == 0);

  status = f.manager->GetDatabaseStatus(ctx, "erin");
  assert(!status.loaded);
  assert(status.address == f.index->Get("erin")->storage_address());
  assert(f.manager->ConnectedDatabases().size() == 1);
  assert(Throws<util::NotFound>([&] { (void)f.manager->GetDatabaseStatus(ctx, "nobody"); }));

  auto report = f.manager->ReloadAll(ctx);
  assert(report.reconnected == 2);
  assert(report.failures.empty());
  assert(f.manager->ConnectedDatabases().size() == 2);
}

void TestRepairAfterCorruption() {
  ShopFixture f("repair");
  auto        ctx = Context::Background();

  auto shop = f.manager->CreateShop(ctx, MakeShop("gina", "0x6", "Gina's"));
  f.manager->CloseShopDatabase("gina");
  f.backend->MarkCorrupted(shop.storage_address());
  f.cache->Clear();

  assert(Throws<util::StoreUnavailable>([&] { (void)f.manager->GetShop(ctx, "gina"); }));

  f.manager->RepairShopDatabase(ctx, "gina");
  assert(f.registry->IsOpen("gina"));

  // the recreated store is empty; metadata still names it
  assert(Throws<util::NotFound>([&] { (void)f.manager->GetShop(ctx, "gina"); }));
  assert(f.manager->GetDatabaseStatus(ctx, "gina").record_count == 0);
}

void TestConnectReconnectsExistingStores() {
  ShopFixture f("reconnect");
  auto        ctx = Context::Background();

  f.manager->CreateShop(ctx, MakeShop("hank", "0x4", "Hank's"));
  f.manager->CreateShop(ctx, MakeShop("iris", "0x5", "Iris'"));

  // a metadata file without an address is skipped
  shopstore::model::ShopMetadata orphan;
  orphan.set_id("orphan");
  f.index->Save(orphan);

  auto registry = std::make_shared<shopstore::registry::StoreRegistry>(f.backend, f.index);
  auto cache    = std::make_shared<shopstore::cache::ShopCache>(10, std::chrono::minutes(1));
  auto restarted = std::make_shared<shopstore::core::ShopManager>(f.index, registry, cache);

  assert(Throws<util::InvalidState>([&] { (void)restarted->GetShopCount(); }));

  auto report = restarted->Connect(ctx);
  assert(report.reconnected == 2);
  assert(report.skipped == 1);
  assert(report.failures.empty());
  assert(registry->IsOpen("hank"));
  assert(restarted->GetShop(ctx, "iris").name() == "Iris'");

  restarted->Close();
}

void TestConnectToleratesBrokenStores() {
  ShopFixture f("broken_on_connect");
  auto        ctx = Context::Background();

  auto shop = f.manager->CreateShop(ctx, MakeShop("jack", "0x7", "Jack's"));
  f.manager->Close();
  f.backend->MarkCorrupted(shop.storage_address());

  auto report = f.manager->Connect(ctx);
  assert(report.reconnected == 0);
  assert(report.failures.size() == 1);
  assert(f.manager->IsConnected());

  assert(Throws<util::AggregateError>([&] { (void)f.manager->ReconnectExisting(ctx); }));
}

void TestClosedManagerRejectsOperations() {
  ShopFixture f("closed");
  auto        ctx = Context::Background();

  f.manager->CreateShop(ctx, MakeShop("kim", "0x8", "Kim's"));
  f.manager->Close();
  f.manager->Close();

  assert(!f.manager->IsConnected());
  assert(f.cache->Size() == 0);
  assert(Throws<util::InvalidState>([&] { (void)f.manager->GetShop(ctx, "kim"); }));
  assert(Throws<util::InvalidState>([&] { (void)f.manager->CreateShop(ctx, MakeShop("lee", "0x9", "Lee's")); }));
  assert(Throws<util::InvalidState>([&] { (void)f.manager->ListShops(ctx, {}); }));
  assert(Throws<util::InvalidState>([&] { (void)f.manager->GetDatabaseStats(ctx); }));
}

} // namespace

int main() {
  TestCreateGetListDelete();
  TestReadsFallBackToStoreOnCacheMiss();
  TestDefaultsAndValidation();
  TestUpdatePreservesCreated();
  TestReadsRacingDeleteDoNotResurrect();
  TestAssets();
  TestAdministration();
  TestRepairAfterCorruption();
  TestConnectReconnectsExistingStores();
  TestConnectToleratesBrokenStores();
  TestClosedManagerRejectsOperations();

  std::cout << "shopstore_unit_shop_manager: pass\n";
  return 0;
}
