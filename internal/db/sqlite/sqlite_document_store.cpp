#include "sqlite_document_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace shopstore::db::sqlite {

using shopstore::db::ErrorCode;
using shopstore::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

SqliteDocumentStore::SqliteDocumentStore(std::string address, std::shared_ptr<SqliteDB> db)
    : address_(std::move(address)), db_(std::move(db)) {
}

void SqliteDocumentStore::Migrate(SqliteDB& db, const std::string& address) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS store_info("
      "  address TEXT NOT NULL"
      ");");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS entries("
      "  seq      INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  op       TEXT    NOT NULL,"
      "  key      TEXT    NOT NULL,"
      "  type     TEXT    NOT NULL,"
      "  body     TEXT    NOT NULL,"
      "  clock_ms INTEGER NOT NULL"
      ");");

  Statement count(db.Prepare("SELECT COUNT(*) FROM store_info;"));
  if (sqlite3_step(count.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("store_info: ") + sqlite3_errmsg(db.Handle()));
  }
  if (sqlite3_column_int64(count.get(), 0) == 0) {
    Statement insert(db.Prepare("INSERT INTO store_info(address) VALUES(?);"));
    BindText(insert.get(), 1, address);
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
      throw std::runtime_error(std::string("store_info: ") + sqlite3_errmsg(db.Handle()));
    }
  }
}

void SqliteDocumentStore::QuickCheck(SqliteDB& db) {
  Statement st(db.Prepare("PRAGMA quick_check;"));
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("quick_check: ") + sqlite3_errmsg(db.Handle()));
  }
  const std::string verdict = ColText(st.get(), 0);
  if (verdict != "ok") throw std::runtime_error("quick_check: " + verdict);
}

Result SqliteDocumentStore::Load(const util::Context& ctx, int64_t depth) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "load cancelled");

  std::scoped_lock lock(mutex_);
  if (!db_) return Result::Err(ErrorCode::Closed, address_);
  auto* h = db_->Handle();

  try {
    QuickCheck(*db_);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::Corruption, address_ + ": " + e.what());
  }

  // newest `depth` entries, replayed oldest first
  const char* sql = depth < 0 ? "SELECT seq, op, key, type, body FROM entries ORDER BY seq ASC;"
                              : "SELECT seq, op, key, type, body FROM "
                                "(SELECT * FROM entries ORDER BY seq DESC LIMIT ?) ORDER BY seq ASC;";

  sqlite3_stmt* raw = nullptr;
  int           rc  = sqlite3_prepare_v2(h, sql, -1, &raw, nullptr);
  Statement     st(raw);
  if (rc != SQLITE_OK) return Translate(h, rc);
  if (depth >= 0) sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(depth));

  std::map<std::string, model::DocumentRecord> index;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "load cancelled");

    const std::string op  = ColText(st.get(), 1);
    std::string       key = ColText(st.get(), 2);
    if (op == "put") {
      model::DocumentRecord doc;
      doc.ref  = std::to_string(sqlite3_column_int64(st.get(), 0));
      doc.key  = key;
      doc.type = ColText(st.get(), 3);
      doc.body = ColText(st.get(), 4);
      index[std::move(key)] = std::move(doc);
    } else {
      index.erase(key);
    }
  }
  if (rc != SQLITE_DONE) return Translate(h, rc);

  index_ = std::move(index);
  return Result::Ok();
}

Result SqliteDocumentStore::Append(const char* op, model::DocumentRecord* doc) {
  try {
    SqliteTransaction tx(db_);
    auto*             h = tx.Handle();

    sqlite3_stmt* raw = nullptr;
    int           rc  = sqlite3_prepare_v2(h, "INSERT INTO entries(op, key, type, body, clock_ms) VALUES(?,?,?,?,?);", -1, &raw, nullptr);
    Statement     st(raw);
    if (rc != SQLITE_OK) return Translate(h, rc);

    sqlite3_bind_text(st.get(), 1, op, -1, SQLITE_STATIC);
    BindText(st.get(), 2, doc->key);
    BindText(st.get(), 3, doc->type);
    BindText(st.get(), 4, doc->body);
    sqlite3_bind_int64(st.get(), 5, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));

    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(h, rc);

    const auto seq = sqlite3_last_insert_rowid(h);
    tx.Commit();
    if (std::string_view(op) == "put") doc->ref = std::to_string(seq);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
}

Result SqliteDocumentStore::Put(const util::Context& ctx, model::DocumentRecord& doc) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "put cancelled");
  if (doc.key.empty()) return Result::Err(ErrorCode::InvalidArgument, "document key is empty");

  std::scoped_lock lock(mutex_);
  if (!db_) return Result::Err(ErrorCode::Closed, address_);

  if (auto r = Append("put", &doc); !r) return r;
  index_[doc.key] = doc;
  return Result::Ok();
}

Result SqliteDocumentStore::Query(const util::Context& ctx, const DocumentPredicate& predicate, std::vector<model::DocumentRecord>* out) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "query cancelled");

  std::scoped_lock lock(mutex_);
  if (!db_) return Result::Err(ErrorCode::Closed, address_);

  out->clear();
  for (const auto& [_, doc] : index_) {
    if (!predicate || predicate(doc)) out->push_back(doc);
  }
  return Result::Ok();
}

Result SqliteDocumentStore::Delete(const util::Context& ctx, const std::string& ref) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "delete cancelled");

  std::scoped_lock lock(mutex_);
  if (!db_) return Result::Err(ErrorCode::Closed, address_);

  auto it = std::find_if(index_.begin(), index_.end(), [&](const auto& kv) { return kv.second.ref == ref; });
  if (it == index_.end()) return Result::Err(ErrorCode::NotFound, "no document with ref " + ref);

  model::DocumentRecord tombstone{ref, it->first, it->second.type, {}};
  if (auto r = Append("del", &tombstone); !r) return r;
  index_.erase(it);
  return Result::Ok();
}

Result SqliteDocumentStore::Close() {
  std::scoped_lock lock(mutex_);
  index_.clear();
  db_.reset();
  return Result::Ok();
}

} // namespace shopstore::db::sqlite
