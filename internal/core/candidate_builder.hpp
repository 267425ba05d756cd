#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/busy_interval.hpp"
#include "internal/model/candidate.hpp"
#include "internal/model/table.hpp"

namespace woki::core {

struct CandidateQuery {
  std::vector<model::Table>        tables;
  std::vector<model::BusyInterval> busy;
  std::vector<model::TimeInterval> windows;
  std::uint32_t                    party_size = 0;
  std::chrono::minutes             duration{0};
  std::chrono::minutes             slot{15};
  std::size_t                      max_combo_size = 6;
};

/*
  Turns inventory + busy snapshot into the full candidate set.

  Each gap yields at most one candidate: its earliest slot-aligned interval
  of the requested duration. Combos are only explored for parties larger
  than one. The result is in selector order.
*/
class CandidateBuilder {
 public:
  static std::vector<model::Candidate> Build(const CandidateQuery& query);

  // Start rounded up to the slot grid (UTC epoch aligned), end = start + duration.
  static std::optional<model::TimeInterval> FirstSlot(const model::TimeInterval& gap, std::chrono::minutes duration, std::chrono::minutes slot);
};

} // namespace woki::core
