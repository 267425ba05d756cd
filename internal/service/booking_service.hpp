#pragma once

#include <string>

#include "service_context.hpp"
#include "woki/v1.hpp"

namespace woki::service {

class BookingService {
public:
  explicit BookingService(ServiceContext ctx);

  woki::v1::DiscoverSeatsResponse
  Discover(const woki::v1::DiscoverSeatsRequest& req, const std::string& request_id = {});

  woki::v1::CreateBookingResponse
  CreateBooking(const woki::v1::CreateBookingRequest& req, const std::string& request_id = {});

  void CancelBooking(const woki::v1::CancelBookingRequest& req, const std::string& request_id = {});

  woki::v1::ListBookingsResponse
  ListBookings(const woki::v1::ListBookingsRequest& req);

private:
  ServiceContext ctx_;
};

}
