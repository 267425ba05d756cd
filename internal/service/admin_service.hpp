#pragma once

#include "woki/v1.hpp"

namespace woki::service {

// Read-only view over the process metrics.
class AdminService {
public:
  woki::v1::GetMetricsResponse
  GetMetrics(const woki::v1::GetMetricsRequest& req);
};

}
