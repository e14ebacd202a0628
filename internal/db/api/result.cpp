#include "internal/db/api/result.hpp"

namespace shopstore::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::Closed:
      return "closed";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::InternalError:
    default:
      return "internal error";
  }
}

} // namespace shopstore::db
