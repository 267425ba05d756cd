#include "internal/core/gap_discovery.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <random>
#include <vector>

#include "internal/util/local_time.hpp"

namespace {

using woki::core::GapDiscovery;
using woki::model::BusyInterval;
using woki::model::BusyKind;
using woki::model::TimeInterval;
using namespace std::chrono_literals;

woki::util::TimePoint At(int hour, int minute = 0) {
  static const auto day = *woki::util::ParseDate("2025-10-22");
  return woki::util::LocalToUtc(day, hour * 60 + minute, absl::UTCTimeZone());
}

TimeInterval Span(int h1, int m1, int h2, int m2) {
  return {At(h1, m1), At(h2, m2)};
}

void TestTouchingBusyIntervalLeavesExactGap() {
  const auto gaps = GapDiscovery::FindGapsInWindow({Span(19, 0, 20, 0)}, Span(19, 0, 21, 0), 60min);
  assert(gaps.size() == 1);
  assert(gaps[0] == Span(20, 0, 21, 0));
}

void TestShortGapsAreDropped() {
  const auto gaps = GapDiscovery::FindGapsInWindow({Span(19, 0, 19, 45), Span(20, 15, 22, 0)}, Span(18, 0, 22, 0), 60min);
  assert(gaps.size() == 1);
  assert(gaps[0] == Span(18, 0, 19, 0));
}

void TestOverlappingBusyIntervalsAreMerged() {
  const auto gaps =
      GapDiscovery::FindGapsInWindow({Span(19, 30, 20, 30), Span(19, 0, 20, 0), Span(19, 15, 19, 45)}, Span(18, 0, 23, 0), 30min);
  assert(gaps.size() == 2);
  assert(gaps[0] == Span(18, 0, 19, 0));
  assert(gaps[1] == Span(20, 30, 23, 0));
}

void TestBusyOutsideWindowIsIgnored() {
  const auto gaps = GapDiscovery::FindGapsInWindow({Span(12, 0, 13, 0), Span(23, 30, 23, 45)}, Span(18, 0, 22, 0), 60min);
  assert(gaps.size() == 1);
  assert(gaps[0] == Span(18, 0, 22, 0));
}

void TestSectorBlackoutCoversEveryTable() {
  const std::vector<BusyInterval> busy = {
      {{}, Span(19, 0, 20, 0), BusyKind::kBlackout},
      {{"T2"}, Span(21, 0, 22, 0), BusyKind::kBooking},
  };
  const std::vector<TimeInterval> windows = {Span(18, 0, 23, 0)};

  const auto t1 = GapDiscovery::FindGapsForTable("T1", busy, windows, 60min);
  assert(t1.size() == 2);
  assert(t1[0] == Span(18, 0, 19, 0));
  assert(t1[1] == Span(20, 0, 23, 0));

  const auto t2 = GapDiscovery::FindGapsForTable("T2", busy, windows, 60min);
  assert(t2.size() == 3);
  assert(t2[1] == Span(20, 0, 21, 0));
}

void TestGapsAcrossSeveralWindows() {
  const std::vector<TimeInterval> windows = {Span(19, 0, 23, 0), Span(12, 0, 15, 0)};
  const auto gaps = GapDiscovery::FindGapsForTable("T1", {{{"T1"}, Span(13, 0, 14, 0), BusyKind::kBooking}}, windows, 60min);
  assert(gaps.size() == 3);
  assert(gaps[0] == Span(12, 0, 13, 0));
  assert(gaps[1] == Span(14, 0, 15, 0));
  assert(gaps[2] == Span(19, 0, 23, 0));
}

void TestComboGapIsIntersectionOfMembers() {
  const std::vector<BusyInterval> busy = {
      {{"A"}, Span(19, 0, 20, 0), BusyKind::kBooking},
      {{"B"}, Span(20, 0, 21, 0), BusyKind::kBooking},
  };
  const auto gaps = GapDiscovery::FindComboGaps({"A", "B"}, busy, {Span(18, 0, 23, 0)}, 60min);
  assert(gaps.size() == 2);
  assert(gaps[0] == Span(18, 0, 19, 0));
  assert(gaps[1] == Span(21, 0, 23, 0));
}

void TestComboWithFullyBookedMemberHasNoGap() {
  const std::vector<BusyInterval> busy = {{{"B"}, Span(18, 0, 23, 0), BusyKind::kBooking}};
  assert(GapDiscovery::FindComboGaps({"A", "B"}, busy, {Span(18, 0, 23, 0)}, 30min).empty());
}

void TestRandomBusySetsNeverProduceConflictingGaps() {
  std::mt19937                       rng(20251022);
  std::uniform_int_distribution<int> slot(0, 27);  // 15 minute slots over 17:00..24:00
  std::uniform_int_distribution<int> length(1, 8);
  std::uniform_int_distribution<int> count(0, 6);
  std::uniform_int_distribution<int> wanted(1, 6);

  const auto window = Span(17, 0, 24, 0);

  for (int iteration = 0; iteration < 500; ++iteration) {
    std::vector<TimeInterval> busy;
    const int                 n = count(rng);
    for (int i = 0; i < n; ++i) {
      const auto start = window.start + std::chrono::minutes(15 * slot(rng));
      busy.push_back({start, start + std::chrono::minutes(15 * length(rng))});
    }
    const auto duration = std::chrono::minutes(15 * wanted(rng));

    const auto gaps = GapDiscovery::FindGapsInWindow(busy, window, duration);
    for (std::size_t i = 0; i < gaps.size(); ++i) {
      assert(gaps[i].end - gaps[i].start >= duration);
      assert(woki::model::Contains(window, gaps[i]));
      for (const auto& b : busy) {
        assert(!woki::model::Overlaps(gaps[i], b));
      }
      if (i > 0) {
        assert(gaps[i - 1].end <= gaps[i].start);
      }
    }
  }
}

} // namespace

int main() {
  TestTouchingBusyIntervalLeavesExactGap();
  TestShortGapsAreDropped();
  TestOverlappingBusyIntervalsAreMerged();
  TestBusyOutsideWindowIsIgnored();
  TestSectorBlackoutCoversEveryTable();
  TestGapsAcrossSeveralWindows();
  TestComboGapIsIntersectionOfMembers();
  TestComboWithFullyBookedMemberHasNoGap();
  TestRandomBusySetsNeverProduceConflictingGaps();

  std::cout << "woki_unit_gap_discovery: pass\n";
  return 0;
}
