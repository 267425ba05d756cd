#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace woki::grpc {

AdminServer::AdminServer(std::shared_ptr<woki::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetMetrics(::grpc::ServerContext*, const woki::v1::GetMetricsRequest* req, woki::v1::GetMetricsResponse* resp) {
  try {
    *resp = service_->GetMetrics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace woki::grpc
