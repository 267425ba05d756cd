#include "internal/core/candidate_builder.hpp"

#include <algorithm>
#include <map>
#include <string>

#include "internal/core/candidate_selector.hpp"
#include "internal/core/capacity_calculator.hpp"
#include "internal/core/combo_generator.hpp"
#include "internal/core/gap_discovery.hpp"

namespace woki::core {

std::optional<model::TimeInterval> CandidateBuilder::FirstSlot(const model::TimeInterval& gap, std::chrono::minutes duration,
                                                               std::chrono::minutes slot) {
  auto start = gap.start;
  if (slot.count() > 0) {
    const auto rem = gap.start.time_since_epoch() % slot;
    if (rem.count() > 0) {
      start += slot - rem;
    } else if (rem.count() < 0) {
      start -= rem;
    }
  }

  model::TimeInterval slot_interval{start, start + duration};
  if (!model::IsValid(slot_interval) || !model::Contains(gap, slot_interval)) {
    return std::nullopt;
  }
  return slot_interval;
}

std::vector<model::Candidate> CandidateBuilder::Build(const CandidateQuery& query) {
  std::vector<model::Candidate> candidates;
  if (query.party_size == 0 || query.duration.count() <= 0) {
    return candidates;
  }

  std::map<std::string, std::vector<model::TimeInterval>> gaps_by_table;
  for (const auto& table : query.tables) {
    gaps_by_table[table.id] = GapDiscovery::FindGapsForTable(table.id, query.busy, query.windows, query.duration);
  }

  for (const auto& table : query.tables) {
    if (!CapacityCalculator::SingleFits(table, query.party_size)) {
      continue;
    }
    for (const auto& gap : gaps_by_table[table.id]) {
      if (auto slot = FirstSlot(gap, query.duration, query.slot)) {
        candidates.push_back({model::CandidateKind::kSingle, {table.id}, *slot, table.min_capacity, table.max_capacity});
      }
    }
  }

  if (query.party_size > 1) {
    for (const auto& members : ComboGenerator::Generate(query.tables, query.party_size, query.max_combo_size)) {
      const auto range = CapacityCalculator::Calculate(members);
      if (!range.Admits(query.party_size)) {
        continue;
      }

      std::vector<std::string>                             ids;
      std::vector<const std::vector<model::TimeInterval>*> per_table;
      for (const auto& member : members) {
        ids.push_back(member.id);
        per_table.push_back(&gaps_by_table[member.id]);
      }
      std::sort(ids.begin(), ids.end());

      for (const auto& gap : GapDiscovery::IntersectGaps(per_table, query.duration)) {
        if (auto slot = FirstSlot(gap, query.duration, query.slot)) {
          candidates.push_back({model::CandidateKind::kCombo, ids, *slot, range.min, range.max});
        }
      }
    }
  }

  CandidateSelector::Order(candidates);
  return candidates;
}

} // namespace woki::core
