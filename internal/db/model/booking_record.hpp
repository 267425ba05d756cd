#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"

namespace woki::db::model {

/*
  Persistent reservation row.

  IMPORTANT:
  - Rows are never deleted; cancellation only flips status.
  - status moves Confirmed -> Cancelled only (see CanTransition).
*/
struct BookingRecord {
  std::string              id;
  std::string              restaurant_id;
  std::string              sector_id;
  std::vector<std::string> table_ids;  // sorted

  std::uint32_t party_size       = 0;
  std::uint64_t start_ms         = 0;
  std::uint64_t end_ms           = 0;
  std::uint32_t duration_minutes = 0;

  woki::model::BookingStatus status = woki::model::BookingStatus::kUnspecified;

  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

} // namespace woki::db::model
