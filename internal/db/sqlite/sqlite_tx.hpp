#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace shopstore::db::sqlite {

/*
  SQLite transaction guard.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - rolls back on scope exit unless committed
*/
class SqliteTransaction final {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit();
  void Rollback();
  bool IsCommitted() const {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
};

} // namespace shopstore::db::sqlite
