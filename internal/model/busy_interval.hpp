#pragma once

#include <string>
#include <vector>

#include "internal/model/time_interval.hpp"

namespace woki::model {

enum class BusyKind { kBooking, kBlackout };

/*
  Something occupying tables over [start, end): a confirmed booking or a
  blackout. A blackout with no table ids covers the whole sector.
*/
struct BusyInterval {
  std::vector<std::string> table_ids;
  TimeInterval             interval;
  BusyKind                 kind = BusyKind::kBooking;

  bool Covers(const std::string& table_id) const;
};

inline bool BusyInterval::Covers(const std::string& table_id) const {
  if (kind == BusyKind::kBlackout && table_ids.empty()) {
    return true;
  }
  for (const auto& id : table_ids) {
    if (id == table_id) {
      return true;
    }
  }
  return false;
}

} // namespace woki::model
