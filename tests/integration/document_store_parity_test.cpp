#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/document_store.hpp"
#include "internal/db/memory/memory_store_backend.hpp"
#include "internal/db/sqlite/sqlite_store_backend.hpp"

namespace {

using shopstore::db::DocumentStorePtr;
using shopstore::db::ErrorCode;
using shopstore::db::StoreBackend;
using shopstore::db::model::DocumentRecord;
using shopstore::util::Context;

struct BackendFactory {
  std::string                                   name;
  std::function<std::shared_ptr<StoreBackend>()> make_backend;
  // Makes the store at `address` unreadable.
  std::function<void(StoreBackend&, const std::string&)> corrupt;
  std::function<void()>                                  cleanup;
};

DocumentRecord Doc(const std::string& key, const std::string& body) {
  DocumentRecord doc;
  doc.key  = key;
  doc.type = "shop";
  doc.body = body;
  return doc;
}

std::vector<DocumentRecord> All(const DocumentStorePtr& store) {
  std::vector<DocumentRecord> docs;
  auto                        result = store->Query(Context::Background(), nullptr, &docs);
  assert(result);
  return docs;
}

std::string BodyOf(const DocumentStorePtr& store, const std::string& key) {
  std::vector<DocumentRecord> docs;
  auto result = store->Query(Context::Background(), [&](const DocumentRecord& doc) { return doc.key == key; }, &docs);
  assert(result);
  return docs.empty() ? std::string() : docs.front().body;
}

DocumentStorePtr Create(StoreBackend& backend, const std::string& name) {
  DocumentStorePtr store;
  auto             created = backend.Create(name, &store);
  assert(created);
  auto loaded = store->Load(Context::Background(), -1);
  assert(loaded);
  return store;
}

DocumentStorePtr Reopen(StoreBackend& backend, const std::string& address, int64_t depth = -1) {
  DocumentStorePtr store;
  auto             opened = backend.Open(address, {}, &store);
  assert(opened);
  auto loaded = store->Load(Context::Background(), depth);
  assert(loaded);
  return store;
}

void VerifyPutQueryDelete(StoreBackend& backend) {
  auto ctx   = Context::Background();
  auto store = Create(backend, "shop-put-query");

  auto a = Doc("a", "{\"v\":1}");
  auto b = Doc("b", "{\"v\":2}");
  assert(store->Put(ctx, a));
  assert(store->Put(ctx, b));
  assert(!a.ref.empty());
  assert(a.ref != b.ref);
  assert(All(store).size() == 2);

  // upsert by key
  auto a2 = Doc("a", "{\"v\":3}");
  assert(store->Put(ctx, a2));
  assert(All(store).size() == 2);
  assert(BodyOf(store, "a") == "{\"v\":3}");

  assert(store->Delete(ctx, a2.ref));
  assert(All(store).size() == 1);
  assert(store->Delete(ctx, a2.ref).code == ErrorCode::NotFound);

  auto empty_key = Doc("", "{}");
  assert(store->Put(ctx, empty_key).code == ErrorCode::InvalidArgument);

  assert(store->Close());
  assert(store->Put(ctx, b).code == ErrorCode::Closed);
}

void VerifyReopenReplaysHistory(StoreBackend& backend) {
  auto ctx     = Context::Background();
  auto store   = Create(backend, "shop-replay");
  auto address = store->Address();

  auto a = Doc("a", "1");
  auto b = Doc("b", "2");
  auto c = Doc("c", "3");
  assert(store->Put(ctx, a));
  assert(store->Put(ctx, b));
  assert(store->Put(ctx, c));
  assert(store->Delete(ctx, a.ref));
  assert(store->Close());

  auto full = Reopen(backend, address);
  assert(full->Address() == address);
  assert(All(full).size() == 2);
  assert(BodyOf(full, "a").empty());
  assert(BodyOf(full, "c") == "3");

  // only "put c" and "delete a" are within the last two entries
  auto shallow = Reopen(backend, address, 2);
  auto docs    = All(shallow);
  assert(docs.size() == 1);
  assert(docs.front().key == "c");

  // refs survive a reopen
  auto c_docs = All(full);
  for (const auto& doc : c_docs) {
    if (doc.key == "b") assert(full->Delete(ctx, doc.ref));
  }
  assert(All(full).size() == 1);

  assert(full->Close());
  assert(shallow->Close());
}

void VerifyUnknownAddressAndRepair(StoreBackend& backend, const BackendFactory& factory) {
  auto ctx = Context::Background();

  DocumentStorePtr missing;
  auto             unknown = backend.Open("nowhere/at/all", {}, &missing);
  assert(!unknown);

  auto store   = Create(backend, "shop-repair");
  auto address = store->Address();
  auto doc     = Doc("k", "v");
  assert(store->Put(ctx, doc));
  assert(store->Close());

  factory.corrupt(backend, address);

  DocumentStorePtr broken;
  auto             opened = backend.Open(address, {}, &broken);
  if (opened) {
    assert(!broken->Load(ctx, -1));
    assert(broken->Close());
  }

  DocumentStorePtr repaired;
  auto             recreated = backend.Open(address, shopstore::db::OpenOptions{.recreate = true}, &repaired);
  assert(recreated);
  assert(repaired->Address() == address);
  assert(repaired->Load(ctx, -1));
  assert(All(repaired).empty());

  auto fresh = Doc("k2", "v2");
  assert(repaired->Put(ctx, fresh));
  assert(repaired->Close());
  assert(All(Reopen(backend, address)).size() == 1);
}

void VerifyCancelledContext(StoreBackend& backend) {
  auto store = Create(backend, "shop-cancel");
  auto ctx   = Context::Background();
  ctx.Cancel();

  auto doc = Doc("k", "v");
  assert(store->Put(ctx, doc).code == ErrorCode::Cancelled);
  assert(store->Load(ctx, -1).code == ErrorCode::Cancelled);
  assert(store->Close());
}

std::vector<BackendFactory> Factories() {
  std::vector<BackendFactory> factories;

  factories.push_back({
      "memory",
      [] { return std::make_shared<shopstore::db::memory::MemoryStoreBackend>(); },
      [](StoreBackend& backend, const std::string& address) {
        static_cast<shopstore::db::memory::MemoryStoreBackend&>(backend).MarkCorrupted(address);
      },
      [] {},
  });

  const auto root = std::filesystem::temp_directory_path() / "shopstore_parity_sqlite";
  std::filesystem::remove_all(root);
  factories.push_back({
      "sqlite",
      [root] {
        shopstore::db::sqlite::SqliteOptions options;
        return std::make_shared<shopstore::db::sqlite::SqliteStoreBackend>(root, options);
      },
      [](StoreBackend& backend, const std::string& address) {
        std::filesystem::path file;
        const bool            ours = static_cast<shopstore::db::sqlite::SqliteStoreBackend&>(backend).PathFor(address, &file);
        assert(ours);
        std::filesystem::remove(file.string() + "-wal");
        std::filesystem::remove(file.string() + "-shm");
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << std::string(8192, 'x');
      },
      [root] { std::filesystem::remove_all(root); },
  });

  return factories;
}

} // namespace

int main() {
  for (const auto& factory : Factories()) {
    auto backend = factory.make_backend();

    VerifyPutQueryDelete(*backend);
    VerifyReopenReplaysHistory(*backend);
    VerifyUnknownAddressAndRepair(*backend, factory);
    VerifyCancelledContext(*backend);

    std::cout << "  " << factory.name << ": ok\n";
    factory.cleanup();
  }

  std::cout << "shopstore_integration_document_store_parity: pass\n";
  return 0;
}
