#pragma once

#include <string>

#include "service_context.hpp"
#include "woki/v1.hpp"

namespace woki::service {

class BlackoutService {
public:
  explicit BlackoutService(ServiceContext ctx);

  woki::v1::CreateBlackoutResponse
  CreateBlackout(const woki::v1::CreateBlackoutRequest& req, const std::string& request_id = {});

  woki::v1::ListBlackoutsResponse
  ListBlackouts(const woki::v1::ListBlackoutsRequest& req);

  void DeleteBlackout(const woki::v1::DeleteBlackoutRequest& req, const std::string& request_id = {});

private:
  ServiceContext ctx_;
};

}
