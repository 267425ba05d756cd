#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/time_interval.hpp"

namespace woki::model {

enum class CandidateKind { kSingle, kCombo };

/*
  Proposed allocation: one table, or 2..6 tables seated together, for one
  interval. table_ids are sorted and unique.
*/
struct Candidate {
  CandidateKind            kind = CandidateKind::kSingle;
  std::vector<std::string> table_ids;
  TimeInterval             interval;
  std::uint32_t            min_capacity = 0;
  std::uint32_t            max_capacity = 0;

  bool operator==(const Candidate&) const = default;
};

} // namespace woki::model
