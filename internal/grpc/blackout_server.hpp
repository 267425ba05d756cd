#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "woki/v1/services.grpc.pb.h"
#include "internal/service/blackout_service.hpp"

namespace woki::grpc {

class BlackoutServer final : public woki::v1::BlackoutService::Service {
public:
  explicit BlackoutServer(std::shared_ptr<woki::service::BlackoutService> svc);

  ::grpc::Status CreateBlackout(::grpc::ServerContext*,
                                const woki::v1::CreateBlackoutRequest*,
                                woki::v1::CreateBlackoutResponse*) override;

  ::grpc::Status ListBlackouts(::grpc::ServerContext*,
                               const woki::v1::ListBlackoutsRequest*,
                               woki::v1::ListBlackoutsResponse*) override;

  ::grpc::Status DeleteBlackout(::grpc::ServerContext*,
                                const woki::v1::DeleteBlackoutRequest*,
                                google::protobuf::Empty*) override;

private:
  std::shared_ptr<woki::service::BlackoutService> service_;
};

}
