#pragma once

#include <memory>

namespace woki::core { class BookingManager; }
namespace woki::core { class BlackoutManager; }

namespace woki::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<woki::core::BookingManager> bookings;
  std::shared_ptr<woki::core::BlackoutManager> blackouts;
};

}
