#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/core/blackout_manager.hpp"
#include "internal/core/booking_manager.hpp"
#include "internal/grpc/booking_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/idempotency/idempotency_store.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "test_inventory.hpp"

namespace {

using woki::grpc::ToStatus;

void TestTaxonomyMapsToStatusCodes() {
  auto status = ToStatus(woki::util::InvalidInput("partySize must be greater than zero"));
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == "invalid_input: partySize must be greater than zero");

  assert(ToStatus(woki::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(woki::util::NoCapacity("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(woki::util::TableLocked("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(woki::lock::LockTimeout("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(woki::util::OutsideServiceWindow("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  status = ToStatus(std::runtime_error("disk on fire"));
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(status.error_message() == "internal: disk on fire");

  assert(ToStatus(woki::util::NoCapacity("x")).error_message().rfind("no_capacity: ", 0) == 0);
  assert(ToStatus(woki::lock::LockTimeout("x")).error_message().rfind("table_locked: ", 0) == 0);
}

void TestMissingContextHasNoRequestId() {
  assert(woki::grpc::RequestId(nullptr).empty());
}

void TestServerAdapterReturnsStatusInsteadOfThrowing() {
  auto repo = woki::testing::SeededRepository();

  woki::service::ServiceContext ctx;
  ctx.bookings  = std::make_shared<woki::core::BookingManager>(repo, std::make_shared<woki::lock::LockCoordinator>(),
                                                               std::make_shared<woki::idempotency::IdempotencyStore>());
  ctx.blackouts = std::make_shared<woki::core::BlackoutManager>(repo);

  woki::grpc::BookingServer server(std::make_shared<woki::service::BookingService>(ctx));

  woki::v1::DiscoverSeatsRequest  req;
  woki::v1::DiscoverSeatsResponse resp;
  req.set_restaurant_id("R1");
  req.set_sector_id("S1");
  req.set_date(woki::testing::kDate);
  req.set_party_size(2);
  req.set_duration_minutes(90);

  auto status = server.Discover(nullptr, &req, &resp);
  assert(status.ok());
  assert(resp.candidates_size() > 0);

  req.set_party_size(40);
  status = server.Discover(nullptr, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);

  woki::v1::CancelBookingRequest cancel;
  cancel.set_id("BK_MISSING0");
  google::protobuf::Empty empty;
  status = server.CancelBooking(nullptr, &cancel, &empty);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  woki::v1::CreateBookingRequest  create;
  woki::v1::CreateBookingResponse created;
  create.set_restaurant_id("R1");
  create.set_sector_id("S1");
  create.set_date(woki::testing::kDate);
  create.set_party_size(2);
  create.set_duration_minutes(90);
  status = server.CreateBooking(nullptr, &create, &created);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestTaxonomyMapsToStatusCodes();
  TestMissingContextHasNoRequestId();
  TestServerAdapterReturnsStatusInsteadOfThrowing();

  std::cout << "woki_unit_grpc_status: pass\n";
  return 0;
}
