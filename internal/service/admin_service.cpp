#include "admin_service.hpp"

#include "internal/observability/metrics.hpp"

namespace woki::service {

using namespace woki::v1;

namespace {

void Fill(const observability::LatencySnapshot& snapshot, LatencySummary* out) {
  if (snapshot.p95_ms) {
    out->set_p95_ms(*snapshot.p95_ms);
  }
  out->set_samples(snapshot.samples);
}

} // namespace

GetMetricsResponse AdminService::GetMetrics(const GetMetricsRequest&) {
  const auto snapshot = observability::Metrics::Instance().Snapshot();

  GetMetricsResponse resp;
  resp.set_bookings_created(snapshot.bookings_created);
  resp.set_bookings_cancelled(snapshot.bookings_cancelled);
  resp.set_conflicts_no_capacity(snapshot.conflicts_no_capacity);
  resp.set_conflicts_table_locked(snapshot.conflicts_table_locked);
  resp.set_lock_timeouts(snapshot.lock_timeouts);
  Fill(snapshot.assignment_time, resp.mutable_assignment_time());
  Fill(snapshot.lock_wait_time, resp.mutable_lock_wait_time());
  return resp;
}

} // namespace woki::service
