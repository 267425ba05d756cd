#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "woki/v1/services.grpc.pb.h"
#include "internal/service/booking_service.hpp"

namespace woki::grpc {

class BookingServer final : public woki::v1::BookingService::Service {
public:
  explicit BookingServer(std::shared_ptr<woki::service::BookingService> svc);

  ::grpc::Status Discover(::grpc::ServerContext*,
                          const woki::v1::DiscoverSeatsRequest*,
                          woki::v1::DiscoverSeatsResponse*) override;

  ::grpc::Status CreateBooking(::grpc::ServerContext*,
                               const woki::v1::CreateBookingRequest*,
                               woki::v1::CreateBookingResponse*) override;

  ::grpc::Status CancelBooking(::grpc::ServerContext*,
                               const woki::v1::CancelBookingRequest*,
                               google::protobuf::Empty*) override;

  ::grpc::Status ListBookings(::grpc::ServerContext*,
                              const woki::v1::ListBookingsRequest*,
                              woki::v1::ListBookingsResponse*) override;

private:
  std::shared_ptr<woki::service::BookingService> service_;
};

}
