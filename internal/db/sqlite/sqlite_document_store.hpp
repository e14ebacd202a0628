#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/document_store.hpp"
#include "sqlite_db.hpp"

namespace shopstore::db::sqlite {

/*
  Per-shop store in its own SQLite file.

  Schema:
    store_info(address)                         single row, written on create
    entries(seq, op, key, type, body, clock_ms) append-only operation log

  Load() replays the log into index_; Query() never touches the file.
*/
class SqliteDocumentStore final : public db::DocumentStore {
 public:
  SqliteDocumentStore(std::string address, std::shared_ptr<SqliteDB> db);

  // Creates tables if missing. Throws std::runtime_error.
  static void Migrate(SqliteDB& db, const std::string& address);

  // Runs PRAGMA quick_check. Throws std::runtime_error unless it reports "ok".
  static void QuickCheck(SqliteDB& db);

  const std::string& Address() const override {
    return address_;
  }

  Result Load(const util::Context& ctx, int64_t depth) override;
  Result Put(const util::Context& ctx, model::DocumentRecord& doc) override;
  Result Query(const util::Context& ctx, const DocumentPredicate& predicate, std::vector<model::DocumentRecord>* out) override;
  Result Delete(const util::Context& ctx, const std::string& ref) override;
  Result Close() override;

 private:
  Result Append(const char* op, model::DocumentRecord* doc);

  const std::string         address_;
  std::shared_ptr<SqliteDB> db_;

  std::mutex                                   mutex_;
  std::map<std::string, model::DocumentRecord> index_; // key -> latest document
};

Result Translate(sqlite3* db, int rc);

} // namespace shopstore::db::sqlite
