#include "blackout_server.hpp"
#include "grpc_error.hpp"

namespace woki::grpc {

BlackoutServer::BlackoutServer(std::shared_ptr<woki::service::BlackoutService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BlackoutServer::CreateBlackout(::grpc::ServerContext* ctx,
                                              const woki::v1::CreateBlackoutRequest* req,
                                              woki::v1::CreateBlackoutResponse* resp) {
  try {
    *resp = service_->CreateBlackout(*req, RequestId(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BlackoutServer::ListBlackouts(::grpc::ServerContext*,
                                             const woki::v1::ListBlackoutsRequest* req,
                                             woki::v1::ListBlackoutsResponse* resp) {
  try {
    *resp = service_->ListBlackouts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BlackoutServer::DeleteBlackout(::grpc::ServerContext* ctx,
                                              const woki::v1::DeleteBlackoutRequest* req,
                                              google::protobuf::Empty*) {
  try {
    service_->DeleteBlackout(*req, RequestId(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace woki::grpc
