#include "grpc_error.hpp"

#include <chrono>

#include "internal/util/errors.hpp"

namespace shopstore::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace shopstore::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const NotOpen*>(&e) || dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const AggregateError*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const Cancelled*>(&e)) {
    return {::grpc::StatusCode::CANCELLED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

util::Context FromServerContext(const ::grpc::ServerContext* context) {
  if (!context) return util::Context::Background();

  const auto deadline = context->deadline();
  if (deadline == std::chrono::system_clock::time_point::max()) return util::Context::Background();

  const auto remaining = deadline - std::chrono::system_clock::now();
  return util::Context::WithTimeout(std::chrono::duration_cast<util::Context::SteadyClock::duration>(remaining));
}

} // namespace shopstore::grpc
