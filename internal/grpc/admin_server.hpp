#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "woki/v1/services.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace woki::grpc {

class AdminServer final : public woki::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<woki::service::AdminService> svc);

  ::grpc::Status GetMetrics(::grpc::ServerContext*,
                            const woki::v1::GetMetricsRequest*,
                            woki::v1::GetMetricsResponse*) override;

private:
  std::shared_ptr<woki::service::AdminService> service_;
};

}
