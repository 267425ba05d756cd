#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/model/busy_interval.hpp"
#include "internal/model/time_interval.hpp"

namespace woki::core {

/*
  Free-interval search over one table or a set of tables.

  Gaps are maximal free half-open intervals inside the active windows, at
  least `duration` long, sorted by start. Overlapping busy intervals are
  merged, so the output never intersects any busy interval.
*/
class GapDiscovery {
 public:
  static std::vector<model::TimeInterval> FindGapsInWindow(std::vector<model::TimeInterval> busy, const model::TimeInterval& window,
                                                           std::chrono::minutes duration);

  static std::vector<model::TimeInterval> FindGapsForTable(const std::string& table_id, const std::vector<model::BusyInterval>& busy,
                                                           const std::vector<model::TimeInterval>& windows, std::chrono::minutes duration);

  static std::vector<model::TimeInterval> FindComboGaps(const std::vector<std::string>& table_ids, const std::vector<model::BusyInterval>& busy,
                                                        const std::vector<model::TimeInterval>& windows, std::chrono::minutes duration);

  // Intersection of per-table gap lists; empty as soon as one list is empty.
  static std::vector<model::TimeInterval> IntersectGaps(const std::vector<const std::vector<model::TimeInterval>*>& per_table,
                                                        std::chrono::minutes duration);
};

} // namespace woki::core
