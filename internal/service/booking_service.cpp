#include "booking_service.hpp"

#include "internal/core/booking_manager.hpp"
#include "proto_mapping.hpp"

namespace woki::service {

using namespace woki::v1;

BookingService::BookingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DiscoverSeatsResponse BookingService::Discover(const DiscoverSeatsRequest& req, const std::string& request_id) {
  core::DiscoverQuery query;
  query.restaurant_id    = req.restaurant_id();
  query.sector_id        = req.sector_id();
  query.date             = req.date();
  query.party_size       = req.party_size();
  query.duration_minutes = req.duration_minutes();
  query.window_start     = req.window().start();
  query.window_end       = req.window().end();
  query.limit            = req.limit();
  query.request_id       = request_id;

  const auto result = ctx_.bookings->Discover(query);

  DiscoverSeatsResponse resp;
  resp.set_slot_minutes(result.slot_minutes);
  resp.set_duration_minutes(result.duration_minutes);
  for (const auto& candidate : result.candidates) {
    *resp.add_candidates() = ToProto(candidate);
  }
  return resp;
}

CreateBookingResponse BookingService::CreateBooking(const CreateBookingRequest& req, const std::string& request_id) {
  core::CreateBookingCommand command;
  command.idempotency_key  = req.idempotency_key();
  command.restaurant_id    = req.restaurant_id();
  command.sector_id        = req.sector_id();
  command.date             = req.date();
  command.party_size       = req.party_size();
  command.duration_minutes = req.duration_minutes();
  command.window_start     = req.window().start();
  command.window_end       = req.window().end();
  command.request_id       = request_id;

  const auto result = ctx_.bookings->CreateBooking(command);

  CreateBookingResponse resp;
  *resp.mutable_booking() = ToProto(result.booking);
  resp.set_replayed(result.replayed);
  return resp;
}

void BookingService::CancelBooking(const CancelBookingRequest& req, const std::string& request_id) {
  ctx_.bookings->CancelBooking(req.id(), request_id);
}

ListBookingsResponse BookingService::ListBookings(const ListBookingsRequest& req) {
  ListBookingsResponse resp;
  resp.set_date(req.date());
  for (const auto& booking : ctx_.bookings->ListBookings(req.restaurant_id(), req.sector_id(), req.date())) {
    *resp.add_items() = ToProto(booking);
  }
  return resp;
}

} // namespace woki::service
