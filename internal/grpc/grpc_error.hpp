#pragma once

#include <string>

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace woki::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The message carries the taxonomy code first: "no_capacity: ...".
*/

::grpc::Status ToStatus(const std::exception& e);

// x-request-id client metadata, empty when absent.
std::string RequestId(const ::grpc::ServerContext* ctx);

} // namespace woki::grpc
