#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace woki::db::model {

enum class BlackoutReason : std::uint8_t {
  kUnspecified  = 0,
  kMaintenance  = 1,
  kPrivateEvent = 2,
  kOther        = 3,
};

struct BlackoutRecord {
  std::string              id;
  std::string              restaurant_id;
  std::string              sector_id;
  std::vector<std::string> table_ids;  // empty = whole sector

  std::uint64_t  start_ms = 0;
  std::uint64_t  end_ms   = 0;
  BlackoutReason reason   = BlackoutReason::kUnspecified;
  std::string    notes;

  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

} // namespace woki::db::model
