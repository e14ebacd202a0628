#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace shopstore::db::sqlite {

struct SqliteOptions {
  bool     wal_mode        = true;
  uint32_t busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  Throws std::runtime_error on open/configure failure; the backend
  translates that into a db::Result.
*/
class SqliteDB {
 public:
  // create=false refuses to open a file that does not exist yet.
  SqliteDB(std::string path, const SqliteOptions& options, bool create);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(const SqliteOptions& options);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Finalizes a prepared statement on scope exit.
*/
class Statement {
 public:
  explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_;
};

} // namespace shopstore::db::sqlite
