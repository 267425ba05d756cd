#include "internal/core/gap_discovery.hpp"

#include <algorithm>

namespace woki::core {

namespace {

void SortByStart(std::vector<model::TimeInterval>& intervals) {
  std::sort(intervals.begin(), intervals.end(), [](const auto& a, const auto& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
  });
}

bool LongEnough(const model::TimeInterval& gap, std::chrono::minutes duration) {
  return gap.end - gap.start >= duration;
}

std::vector<model::TimeInterval> IntersectPair(const std::vector<model::TimeInterval>& a, const std::vector<model::TimeInterval>& b) {
  std::vector<model::TimeInterval> out;
  for (const auto& x : a) {
    for (const auto& y : b) {
      if (auto overlap = model::Intersect(x, y)) {
        out.push_back(*overlap);
      }
    }
  }
  SortByStart(out);
  return out;
}

} // namespace

std::vector<model::TimeInterval> GapDiscovery::FindGapsInWindow(std::vector<model::TimeInterval> busy, const model::TimeInterval& window,
                                                                std::chrono::minutes duration) {
  std::vector<model::TimeInterval> gaps;
  if (!model::IsValid(window)) {
    return gaps;
  }

  busy.erase(std::remove_if(busy.begin(), busy.end(), [&](const auto& b) { return !model::Overlaps(b, window); }), busy.end());
  SortByStart(busy);

  // cursor = end of everything seen so far, starting at the window-start sentinel
  auto cursor = window.start;
  for (const auto& b : busy) {
    if (cursor < b.start) {
      model::TimeInterval gap{cursor, std::min(b.start, window.end)};
      if (LongEnough(gap, duration)) gaps.push_back(gap);
    }
    cursor = std::max(cursor, b.end);
    if (cursor >= window.end) {
      return gaps;
    }
  }

  model::TimeInterval tail{cursor, window.end};
  if (model::IsValid(tail) && LongEnough(tail, duration)) {
    gaps.push_back(tail);
  }
  return gaps;
}

std::vector<model::TimeInterval> GapDiscovery::FindGapsForTable(const std::string& table_id, const std::vector<model::BusyInterval>& busy,
                                                                const std::vector<model::TimeInterval>& windows, std::chrono::minutes duration) {
  std::vector<model::TimeInterval> table_busy;
  for (const auto& b : busy) {
    if (b.Covers(table_id)) {
      table_busy.push_back(b.interval);
    }
  }

  std::vector<model::TimeInterval> gaps;
  for (const auto& window : windows) {
    auto window_gaps = FindGapsInWindow(table_busy, window, duration);
    gaps.insert(gaps.end(), window_gaps.begin(), window_gaps.end());
  }
  SortByStart(gaps);
  gaps.erase(std::unique(gaps.begin(), gaps.end()), gaps.end());
  return gaps;
}

std::vector<model::TimeInterval> GapDiscovery::FindComboGaps(const std::vector<std::string>& table_ids, const std::vector<model::BusyInterval>& busy,
                                                             const std::vector<model::TimeInterval>& windows, std::chrono::minutes duration) {
  std::vector<std::vector<model::TimeInterval>> per_table;
  per_table.reserve(table_ids.size());
  for (const auto& id : table_ids) {
    per_table.push_back(FindGapsForTable(id, busy, windows, duration));
    if (per_table.back().empty()) {
      return {};
    }
  }

  std::vector<const std::vector<model::TimeInterval>*> refs;
  for (const auto& gaps : per_table) refs.push_back(&gaps);
  return IntersectGaps(refs, duration);
}

std::vector<model::TimeInterval> GapDiscovery::IntersectGaps(const std::vector<const std::vector<model::TimeInterval>*>& per_table,
                                                             std::chrono::minutes duration) {
  if (per_table.empty()) {
    return {};
  }
  for (const auto* gaps : per_table) {
    if (gaps->empty()) return {};
  }

  auto intersection = *per_table.front();
  for (std::size_t i = 1; i < per_table.size() && !intersection.empty(); ++i) {
    intersection = IntersectPair(intersection, *per_table[i]);
  }

  intersection.erase(std::remove_if(intersection.begin(), intersection.end(), [&](const auto& gap) { return !LongEnough(gap, duration); }),
                     intersection.end());
  return intersection;
}

} // namespace woki::core
