#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/table.hpp"

namespace woki::core {

struct CapacityRange {
  std::uint32_t min = 0;
  std::uint32_t max = 0;

  bool Admits(std::uint32_t party_size) const {
    return min <= party_size && party_size <= max;
  }
};

/*
  Additive capacity model: a combo seats the sum of its members' minimums up
  to the sum of their maximums. No seating geometry.
*/
class CapacityCalculator {
 public:
  static CapacityRange Calculate(const std::vector<model::Table>& members);

  // A party of one may sit at any table with room for one, whatever its
  // minimum.
  static bool SingleFits(const model::Table& table, std::uint32_t party_size);
};

} // namespace woki::core
