#include "internal/core/candidate_selector.hpp"

#include <algorithm>

namespace woki::core {

bool CandidateSelector::Before(const model::Candidate& a, const model::Candidate& b) {
  if (a.kind != b.kind) {
    return a.kind == model::CandidateKind::kSingle;
  }

  if (a.kind == model::CandidateKind::kCombo && a.table_ids.size() != b.table_ids.size()) {
    return a.table_ids.size() < b.table_ids.size();
  }
  if (a.interval.start != b.interval.start) {
    return a.interval.start < b.interval.start;
  }
  if (a.table_ids != b.table_ids) {
    return a.table_ids < b.table_ids;
  }
  return a.interval.end < b.interval.end;
}

void CandidateSelector::Order(std::vector<model::Candidate>& candidates) {
  std::sort(candidates.begin(), candidates.end(), &CandidateSelector::Before);
}

std::optional<model::Candidate> CandidateSelector::SelectBest(const std::vector<model::Candidate>& candidates) {
  if (candidates.empty()) {
    return std::nullopt;
  }
  return *std::min_element(candidates.begin(), candidates.end(), &CandidateSelector::Before);
}

} // namespace woki::core
