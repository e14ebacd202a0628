#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/context.hpp"
#include "internal/util/errors.hpp"

namespace shopstore::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Carries the caller's deadline into the manager; no deadline means none here either.
util::Context FromServerContext(const ::grpc::ServerContext* context);

} // namespace shopstore::grpc
