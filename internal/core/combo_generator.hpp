#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/model/table.hpp"

namespace woki::core {

/*
  Bounded backtracking over table subsets.

  Tables are visited largest max capacity first (ties by id) so capacity
  pruning cuts early. Every subset of 2..max_size members whose summed
  range admits the party is recorded; search continues past a hit because
  larger supersets can also fit. A branch is skipped when even every
  remaining table could not lift the maximum to the party size.
*/
class ComboGenerator {
 public:
  static constexpr std::size_t kMaxComboSize = 6;

  // Each combo lists its members in search order.
  static std::vector<std::vector<model::Table>> Generate(const std::vector<model::Table>& tables, std::uint32_t party_size,
                                                         std::size_t max_size = kMaxComboSize);
};

} // namespace woki::core
