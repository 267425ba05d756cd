#pragma once

#include <cstdint>
#include <string_view>

namespace woki::model {

enum class BookingStatus : std::uint8_t {
  kUnspecified = 0,
  kConfirmed   = 1,
  kCancelled   = 2,
};

// Bookings are never deleted and never come back once cancelled.
constexpr bool CanTransition(BookingStatus from, BookingStatus to) {
  if (from == to) {
    return true;
  }
  return from == BookingStatus::kConfirmed && to == BookingStatus::kCancelled;
}

constexpr std::string_view StatusName(BookingStatus status) {
  switch (status) {
    case BookingStatus::kConfirmed:
      return "CONFIRMED";
    case BookingStatus::kCancelled:
      return "CANCELLED";
    default:
      return "UNSPECIFIED";
  }
}

} // namespace woki::model
