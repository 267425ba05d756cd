#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace woki::core {
class BookingManager;
class BlackoutManager;
}

namespace woki::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<core::BookingManager>  bookings;
  std::shared_ptr<core::BlackoutManager> blackouts;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config and seeds the
  configured inventory.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const woki::runtime::config::RuntimeConfig& config);

} // namespace woki::factory
