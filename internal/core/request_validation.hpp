#pragma once

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <cstdint>
#include <string>
#include <vector>

#include "internal/core/booking_policy.hpp"
#include "internal/db/model/inventory_records.hpp"
#include "internal/model/time_interval.hpp"

namespace woki::core {

/*
  Validating stage. Everything here runs before any search or locking and
  throws the taxonomy errors (InvalidInput, OutsideServiceWindow).
*/
class RequestValidation {
 public:
  static absl::CivilDay ParseDate(const std::string& date);

  static void CheckPartySize(std::uint32_t party_size);

  static void CheckDuration(std::uint32_t duration_minutes, const BookingPolicy& policy);

  // Malformed "HH:mm" bounds are InvalidInput. Empty means absent.
  static void CheckWindowSyntax(const std::string& window_start, const std::string& window_end);

  /*
    Active windows for one local day, as UTC intervals sorted by start.

    - both bounds: must be ordered and overlap a service window (when any
      exist), else OutsideServiceWindow; replaces the service windows
    - one bound: clips every service window
    - no service windows: the whole local day
  */
  static std::vector<model::TimeInterval> ResolveWindows(absl::CivilDay day, const absl::TimeZone& zone,
                                                         const std::vector<db::model::ServiceWindowRecord>& service_windows,
                                                         const std::string& window_start, const std::string& window_end);
};

} // namespace woki::core
