#include "internal/core/capacity_calculator.hpp"

namespace woki::core {

CapacityRange CapacityCalculator::Calculate(const std::vector<model::Table>& members) {
  CapacityRange range;
  for (const auto& table : members) {
    range.min += table.min_capacity;
    range.max += table.max_capacity;
  }
  return range;
}

bool CapacityCalculator::SingleFits(const model::Table& table, std::uint32_t party_size) {
  if (party_size == 1) {
    return table.max_capacity >= 1;
  }
  return table.min_capacity <= party_size && party_size <= table.max_capacity;
}

} // namespace woki::core
