#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace woki::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace woki::util;

  const auto message = std::string(ErrorCodeName(e)) + ": " + e.what();

  if (dynamic_cast<const InvalidInput*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, message};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, message};
  }
  if (dynamic_cast<const NoCapacity*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, message};
  }
  if (dynamic_cast<const TableLocked*>(&e)) {
    return {::grpc::StatusCode::ABORTED, message};
  }
  if (dynamic_cast<const OutsideServiceWindow*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, message};
  }

  return {::grpc::StatusCode::INTERNAL, message};
}

std::string RequestId(const ::grpc::ServerContext* ctx) {
  if (!ctx) {
    return {};
  }
  const auto& metadata = ctx->client_metadata();
  auto        it       = metadata.find("x-request-id");
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace woki::grpc
