#pragma once

#include <filesystem>
#include <string>

#include "internal/db/api/document_store.hpp"
#include "sqlite_db.hpp"

namespace shopstore::db::sqlite {

/*
  One SQLite file per store.

  address: shopstore/<uuid>/<name>
  file:    <root>/<uuid>/<name>.sqlite
*/
class SqliteStoreBackend final : public db::StoreBackend {
 public:
  SqliteStoreBackend(std::filesystem::path root, SqliteOptions options);

  Result Open(const std::string& address, const OpenOptions& options, DocumentStorePtr* out) override;
  Result Create(const std::string& name, DocumentStorePtr* out) override;

  std::string Name() const override {
    return "sqlite";
  }

  // Resolves an address to its file; false when the address is not ours.
  bool PathFor(const std::string& address, std::filesystem::path* out) const;

 private:
  Result OpenFile(const std::string& address, const std::filesystem::path& file, bool create, bool verify, DocumentStorePtr* out);

  std::filesystem::path root_;
  SqliteOptions         options_;
};

} // namespace shopstore::db::sqlite
