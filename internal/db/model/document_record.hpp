#pragma once

#include <string>

namespace shopstore::db::model {

/*
  One document in a per-shop store.

  body is JSON text so every backend stores it the same way:
    sqlite -> text column
    memory -> string
*/

struct DocumentRecord {
  // backend-assigned reference, valid for Delete() until the next Put of the same key
  std::string ref;

  std::string key;

  // "shop" for root records
  std::string type;

  std::string body;
};

} // namespace shopstore::db::model
