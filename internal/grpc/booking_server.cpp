#include "booking_server.hpp"
#include "grpc_error.hpp"

namespace woki::grpc {

BookingServer::BookingServer(std::shared_ptr<woki::service::BookingService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BookingServer::Discover(::grpc::ServerContext* ctx,
                                       const woki::v1::DiscoverSeatsRequest* req,
                                       woki::v1::DiscoverSeatsResponse* resp) {
  try {
    *resp = service_->Discover(*req, RequestId(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::CreateBooking(::grpc::ServerContext* ctx,
                                            const woki::v1::CreateBookingRequest* req,
                                            woki::v1::CreateBookingResponse* resp) {
  try {
    *resp = service_->CreateBooking(*req, RequestId(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::CancelBooking(::grpc::ServerContext* ctx,
                                            const woki::v1::CancelBookingRequest* req,
                                            google::protobuf::Empty*) {
  try {
    service_->CancelBooking(*req, RequestId(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::ListBookings(::grpc::ServerContext*,
                                           const woki::v1::ListBookingsRequest* req,
                                           woki::v1::ListBookingsResponse* resp) {
  try {
    *resp = service_->ListBookings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace woki::grpc
