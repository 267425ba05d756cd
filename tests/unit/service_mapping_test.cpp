#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/blackout_manager.hpp"
#include "internal/core/booking_manager.hpp"
#include "internal/idempotency/idempotency_store.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/blackout_service.hpp"
#include "internal/service/booking_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "test_inventory.hpp"

namespace {

using namespace woki::v1;
using woki::testing::At;

woki::service::ServiceContext MakeContext() {
  auto repo = woki::testing::SeededRepository();

  woki::service::ServiceContext ctx;
  ctx.bookings = std::make_shared<woki::core::BookingManager>(repo, std::make_shared<woki::lock::LockCoordinator>(),
                                                              std::make_shared<woki::idempotency::IdempotencyStore>());
  ctx.blackouts = std::make_shared<woki::core::BlackoutManager>(repo);
  woki::observability::Metrics::Instance().Reset();
  return ctx;
}

CreateBookingRequest DinnerRequest(const std::string& key, uint32_t party_size) {
  CreateBookingRequest req;
  req.set_idempotency_key(key);
  req.set_restaurant_id("R1");
  req.set_sector_id("S1");
  req.set_date(woki::testing::kDate);
  req.set_party_size(party_size);
  req.set_duration_minutes(90);
  req.mutable_window()->set_start("20:00");
  req.mutable_window()->set_end("23:45");
  return req;
}

void TestDiscoverResponseCarriesCandidates() {
  woki::service::BookingService service(MakeContext());

  DiscoverSeatsRequest req;
  req.set_restaurant_id("R1");
  req.set_sector_id("S1");
  req.set_date(woki::testing::kDate);
  req.set_party_size(7);
  req.set_duration_minutes(90);
  req.mutable_window()->set_start("20:00");
  req.mutable_window()->set_end("23:45");
  req.set_limit(3);

  const auto resp = service.Discover(req, "req-1");
  assert(resp.slot_minutes() == 15);
  assert(resp.duration_minutes() == 90);
  assert(resp.candidates_size() == 3);

  const auto& best = resp.candidates(0);
  assert(best.kind() == CANDIDATE_KIND_COMBO);
  assert(best.table_ids_size() == 2);
  assert(best.table_ids(0) == "T1");
  assert(best.table_ids(1) == "T4");
  assert(woki::util::FromProto(best.start()) == At(20, 0));
  assert(woki::util::FromProto(best.end()) == At(21, 30));
  assert(best.min_capacity() == 6);
  assert(best.max_capacity() == 8);
}

void TestBookingRoundTripThroughServices() {
  auto                              ctx = MakeContext();
  woki::service::BookingService     bookings(ctx);
  woki::service::BlackoutService    blackouts(ctx);
  woki::service::AdminService       admin;

  const auto created = bookings.CreateBooking(DinnerRequest("svc-1", 2));
  assert(!created.replayed());
  assert(created.booking().status() == BOOKING_STATUS_CONFIRMED);
  assert(created.booking().table_ids(0) == "T1");
  assert(woki::util::FromProto(created.booking().start()) == At(20, 0));
  assert(bookings.CreateBooking(DinnerRequest("svc-1", 2)).replayed());

  ListBookingsRequest list;
  list.set_restaurant_id("R1");
  list.set_sector_id("S1");
  list.set_date(woki::testing::kDate);
  auto listed = bookings.ListBookings(list);
  assert(listed.date() == woki::testing::kDate);
  assert(listed.items_size() == 1);

  CreateBlackoutRequest blackout;
  blackout.set_restaurant_id("R1");
  blackout.set_sector_id("S1");
  blackout.add_table_ids("T1");
  *blackout.mutable_start() = woki::util::ToProto(At(20, 30));
  *blackout.mutable_end()   = woki::util::ToProto(At(21, 0));
  blackout.set_reason(BLACKOUT_REASON_OTHER);
  blackout.set_notes("leak");
  const auto closed = blackouts.CreateBlackout(blackout, "req-2");
  assert(closed.blackout().reason() == BLACKOUT_REASON_OTHER);
  assert(closed.cancelled_booking_ids_size() == 1);
  assert(closed.cancelled_booking_ids(0) == created.booking().id());

  listed = bookings.ListBookings(list);
  assert(listed.items(0).status() == BOOKING_STATUS_CANCELLED);

  ListBlackoutsRequest list_blackouts;
  list_blackouts.set_restaurant_id("R1");
  list_blackouts.set_sector_id("S1");
  list_blackouts.set_date(woki::testing::kDate);
  assert(blackouts.ListBlackouts(list_blackouts).items_size() == 1);

  DeleteBlackoutRequest remove;
  remove.set_id(closed.blackout().id());
  blackouts.DeleteBlackout(remove);
  assert(blackouts.ListBlackouts(list_blackouts).items_size() == 0);

  const auto metrics = admin.GetMetrics(GetMetricsRequest{});
  assert(metrics.bookings_created() == 1);
  assert(metrics.bookings_cancelled() == 1);
  assert(metrics.assignment_time().samples() == 1);
  assert(!metrics.assignment_time().has_p95_ms());
}

void TestBlackoutRequestNeedsBounds() {
  woki::service::BlackoutService blackouts(MakeContext());

  CreateBlackoutRequest req;
  req.set_restaurant_id("R1");
  req.set_sector_id("S1");
  req.set_reason(BLACKOUT_REASON_MAINTENANCE);
  *req.mutable_start() = woki::util::ToProto(At(20, 0));

  bool threw = false;
  try {
    blackouts.CreateBlackout(req);
  } catch (const woki::util::InvalidInput&) {
    threw = true;
  }
  assert(threw);

  *req.mutable_end() = woki::util::ToProto(At(21, 0));
  req.set_reason(BLACKOUT_REASON_UNSPECIFIED);
  threw = false;
  try {
    blackouts.CreateBlackout(req);
  } catch (const woki::util::InvalidInput&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDiscoverResponseCarriesCandidates();
  TestBookingRoundTripThroughServices();
  TestBlackoutRequestNeedsBounds();

  std::cout << "woki_unit_service_mapping: pass\n";
  return 0;
}
