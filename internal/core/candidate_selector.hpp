#pragma once

#include <optional>
#include <vector>

#include "internal/model/candidate.hpp"

namespace woki::core {

/*
  Deterministic total order over candidates.

    1. any single beats any combo
    2. singles: earlier start, then smaller table id
    3. combos: fewer tables, then earlier start, then the sorted id lists
       compared lexicographically (smallest first id wins)

  Input order never affects the result.
*/
class CandidateSelector {
 public:
  // Strict weak ordering: true when a should be chosen before b.
  static bool Before(const model::Candidate& a, const model::Candidate& b);

  static void Order(std::vector<model::Candidate>& candidates);

  static std::optional<model::Candidate> SelectBest(const std::vector<model::Candidate>& candidates);
};

} // namespace woki::core
