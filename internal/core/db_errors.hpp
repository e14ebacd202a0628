#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace shopstore::core {

// Backend result -> domain exception. Store-level failures all surface as
// StoreUnavailable so callers can offer a repair.
inline void ThrowIfDbError(const shopstore::db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }

  const std::string msg = prefix + ": " + (result.message.empty() ? shopstore::db::ToString(result.code) : result.message);
  switch (result.code) {
    case shopstore::db::ErrorCode::NotFound:
      throw util::NotFound(msg);
    case shopstore::db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    case shopstore::db::ErrorCode::InvalidArgument:
      throw util::ValidationError(msg);
    case shopstore::db::ErrorCode::Cancelled:
      throw util::Cancelled(msg);
    case shopstore::db::ErrorCode::Unavailable:
    case shopstore::db::ErrorCode::Closed:
    case shopstore::db::ErrorCode::Corruption:
    case shopstore::db::ErrorCode::Busy:
      throw util::StoreUnavailable(msg);
    default:
      throw util::StorageError(msg);
  }
}

} // namespace shopstore::core
